#pragma once

#include <chrono>
#include <cstddef>
#include <ctime>
#include <fstream>
#include <string>

// Appends one CSV row per session event to a log file. Never writes to the
// terminal the menu is drawn on.
class MenuLogger {

	public:
    explicit MenuLogger(const std::string& log_path);
    // elapsed_ms of later rows counts from here (construction until called)
    void start_timer();
    // the open row carries page_count/option_count in the page/option columns
    void log_open(std::size_t option_count, std::size_t page_count);
    void log_confirm(std::size_t page, std::size_t option, const std::string& label);
    void log_exit(std::size_t page, std::size_t option);

	private:
    void write_row(const std::string& event, std::size_t page, std::size_t option, const std::string& label);

    std::string   log_path_;
    std::ofstream out_;
    bool          enabled_ = false;
    std::time_t   session_ = 0;
    std::chrono::time_point<std::chrono::steady_clock> start_time_;
};
