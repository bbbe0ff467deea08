#include "utils/traffic_log.hpp"

#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace traffic_log {

std::string format_timestamp(std::chrono::system_clock::time_point time_point) {
    std::time_t seconds = std::chrono::system_clock::to_time_t(time_point);
    long milliseconds = static_cast<long>(
        std::chrono::duration_cast<std::chrono::milliseconds>(time_point.time_since_epoch()).count() % 1000);
    if (milliseconds < 0) {
        milliseconds += 1000;
    }

    std::tm utc_time{};
    gmtime_r(&seconds, &utc_time);

    std::ostringstream output;
    output << std::put_time(&utc_time, "%Y-%m-%d %H:%M:%S") << '.'
           << std::setw(3) << std::setfill('0') << milliseconds;
    return output.str();
}

TrafficLog::~TrafficLog() {
    close();
}

void TrafficLog::open(const std::string &log_directory) {
    std::filesystem::path directory(log_directory);
    std::filesystem::path read_path = directory / "read.log";
    std::filesystem::path write_path = directory / "write.log";

    read_stream_.open(read_path, std::ios::out | std::ios::app);
    if (!read_stream_.is_open()) {
        throw std::runtime_error("Cannot open log file " + read_path.string());
    }
    write_stream_.open(write_path, std::ios::out | std::ios::app);
    if (!write_stream_.is_open()) {
        read_stream_.close();
        throw std::runtime_error("Cannot open log file " + write_path.string());
    }
}

bool TrafficLog::is_open() const {
    return read_stream_.is_open() && write_stream_.is_open();
}

void TrafficLog::record_read(const std::string &line) {
    if (!read_stream_.is_open()) {
        return;
    }
    read_stream_ << "[" << format_timestamp(std::chrono::system_clock::now()) << "] " << line << std::endl;
}

void TrafficLog::record_write(const std::string &label, const std::string &text) {
    if (!write_stream_.is_open()) {
        return;
    }
    write_stream_ << "[" << format_timestamp(std::chrono::system_clock::now()) << "] "
                  << label << ": " << text << std::endl;
}

void TrafficLog::close() {
    if (read_stream_.is_open()) {
        read_stream_.flush();
        read_stream_.close();
    }
    if (write_stream_.is_open()) {
        write_stream_.flush();
        write_stream_.close();
    }
}

} // namespace traffic_log
