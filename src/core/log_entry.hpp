#ifndef LOG_ENTRY_HPP
#define LOG_ENTRY_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// One line of an HAProxy HTTP-format log. Only lines that fully match the
// grammar become a LogEntry; everything else is reported as std::nullopt.
struct LogEntry {
  uint64_t original_line_number;
  bool valid;

  std::string client_ip;
  int client_port;

  // Connection accept time, the chronological key of every analysis
  std::string raw_accept_date;
  uint64_t accept_date_ms;

  std::string frontend_name;
  std::string backend_name;
  std::string server_name;

  // Timers in milliseconds (Tq/Tw/Tc/Tr/Tt); -1 when HAProxy aborted early
  int64_t time_wait_request;
  int64_t time_wait_queues;
  int64_t time_connect_server;
  int64_t time_wait_response;
  int64_t total_time;

  int status_code;
  uint64_t bytes_read;

  std::string captured_request_cookie;
  std::string captured_response_cookie;
  std::string termination_state;

  int active_connections;
  int frontend_connections;
  int backend_connections;
  int server_connections;
  int retries;

  int queue_server;
  int queue_backend;

  // Raw "{...}" blocks as logged, braces included
  std::optional<std::string> captured_request_headers;
  std::optional<std::string> captured_response_headers;

  std::string raw_http_request;
  std::string http_request_method;
  std::string http_request_path;
  std::string http_request_query;
  std::string http_request_protocol;

  LogEntry();

  bool is_https() const { return client_port == 443; }

  // Static function to create LogEntry from an already stripped raw line
  static std::optional<LogEntry>
  parse_from_string(std::string_view log_line, uint64_t line_num,
                    bool verbose_warnings = false);

private:
  // Helper function to split the quoted request ("GET /a?b=c HTTP/1.1") into
  // method, path, query and protocol
  static void parse_request_details(std::string_view full_request_field,
                                    std::string &out_method,
                                    std::string &out_path,
                                    std::string &out_query,
                                    std::string &out_protocol);
};

#endif // LOG_ENTRY_HPP
