#include "menu_logger.hpp"
#include <filesystem>
#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

namespace {
// Quotes a CSV field when it holds a separator, quote or newline.
std::string csv_field(const std::string& value) {
	if (value.find_first_of(",\"\n") == std::string::npos) return value;
	std::string quoted = "\"";
	for (char c : value) {
		if (c == '"') quoted += '"';
		quoted += c;
	}
	quoted += '"';
	return quoted;
}
} // namespace

MenuLogger::MenuLogger(const std::string& log_path)
: log_path_(log_path),
session_(std::time(nullptr)),
start_time_(std::chrono::steady_clock::now())
{
	if (log_path_.empty()) return;
	std::error_code ec;
	const fs::path p(log_path_);
	const bool fresh = !fs::exists(p, ec);
	if (p.has_parent_path()) fs::create_directories(p.parent_path(), ec);
	out_.open(log_path_, std::ios::app);
	if (!out_.is_open()) {
		std::cerr << "[MenuLogger] cannot open " << log_path_ << ", session logging disabled\n";
		return;
	}
	enabled_ = true;
	if (fresh) out_ << "session,event,page,option,label,elapsed_ms\n";
}

void MenuLogger::start_timer() {
	start_time_ = std::chrono::steady_clock::now();
}

void MenuLogger::log_open(std::size_t option_count, std::size_t page_count) {
	write_row("open", page_count, option_count, "");
}

void MenuLogger::log_confirm(std::size_t page, std::size_t option, const std::string& label) {
	write_row("confirm", page, option, label);
}

void MenuLogger::log_exit(std::size_t page, std::size_t option) {
	write_row("exit", page, option, "");
}

void MenuLogger::write_row(const std::string& event,
                           std::size_t page,
                           std::size_t option,
                           const std::string& label) {
	if (!enabled_) return;
	const auto now = std::chrono::steady_clock::now();
	const double elapsed_ms = std::chrono::duration<double, std::milli>(now - start_time_).count();
	out_ << session_ << ',' << event << ',' << page << ',' << option << ','
	     << csv_field(label) << ',' << elapsed_ms << '\n';
	out_.flush();
	if (!out_) {
		std::cerr << "[MenuLogger] write to " << log_path_ << " failed, session logging disabled\n";
		enabled_ = false;
	}
}
