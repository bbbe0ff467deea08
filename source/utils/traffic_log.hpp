#ifndef SQLMCPS_TRAFFIC_LOG_HPP
#define SQLMCPS_TRAFFIC_LOG_HPP

// Append-only request/response log files written in debug mode.
// read.log gets every inbound line, write.log gets requests, responses and errors,
// each prefixed with a UTC timestamp. Owned by main and passed down by reference.

#include <chrono>
#include <fstream>
#include <string>

namespace traffic_log {

// Format a point in time as "yyyy-MM-dd HH:mm:ss.fff" (UTC).
std::string format_timestamp(std::chrono::system_clock::time_point time_point);

class TrafficLog {
public:
    TrafficLog() = default;
    ~TrafficLog();

    TrafficLog(const TrafficLog &) = delete;
    TrafficLog &operator=(const TrafficLog &) = delete;

    // Open (append) read.log and write.log inside log_directory.
    // Throws std::runtime_error if either file cannot be opened.
    void open(const std::string &log_directory);

    bool is_open() const;

    // "[timestamp] <line>" into read.log.
    void record_read(const std::string &line);

    // "[timestamp] <label>: <text>" into write.log.
    void record_write(const std::string &label, const std::string &text);

    // Flush and close both files. Safe to call more than once.
    void close();

private:
    std::ofstream read_stream_;
    std::ofstream write_stream_;
};

} // namespace traffic_log

#endif // SQLMCPS_TRAFFIC_LOG_HPP
