#include "log_entry.hpp"
#include "utils/utils.hpp"

#include <cctype>
#include <iostream>
#include <optional>
#include <regex>
#include <string>
#include <string_view>

namespace {

// Dec  9 13:01:26 localhost haproxy[28029]: 127.0.0.1:39759
//   [09/Dec/2013:12:59:46.633] loadbalancer default/instance8
//   0/51536/1/48082/99627 200 83285 - - ---- 87/87/87/1/0 0/67
//   {77.24.148.74} "GET /path/to/image HTTP/1.1"
const std::regex &haproxy_line_regex() {
  static const std::regex line_regex(
      R"(\w+\s+\d+\s+\d+:\d+:\d+\s+\S+\s+\w+\[\d+\]:\s+)"
      R"(([a-fA-F\d\.:]+):(\d+)\s+)"
      R"(\[([^\]]+)\]\s+)"
      R"((\S+)\s+([^\s/]+)/(\S+)\s+)"
      R"((-?\d+)/(-?\d+)/(-?\d+)/(-?\d+)/(\+?\d+)\s+)"
      R"((-?\d+)\s+(\+?\d+)\s+)"
      R"((\S+)\s+(\S+)\s+(\S+)\s+)"
      R"((\d+)/(\d+)/(\d+)/(\d+)/(\+?\d+)\s+)"
      R"((\d+)/(\d+)\s+)"
      R"((?:(\{[^}]*\})\s+(\{[^}]*\})\s+|(\{[^}]*\})\s+)?)"
      R"re("(.*)")re",
      std::regex::optimize);
  return line_regex;
}

enum Group : size_t {
  CLIENT_IP = 1,
  CLIENT_PORT,
  ACCEPT_DATE,
  FRONTEND,
  BACKEND,
  SERVER,
  TQ,
  TW,
  TC,
  TR,
  TT,
  STATUS_CODE,
  BYTES_READ,
  REQUEST_COOKIE,
  RESPONSE_COOKIE,
  TERMINATION_STATE,
  ACTCONN,
  FECONN,
  BECONN,
  SRV_CONN,
  RETRIES,
  QUEUE_SERVER,
  QUEUE_BACKEND,
  REQUEST_HEADERS,
  RESPONSE_HEADERS,
  ONLY_HEADERS,
  HTTP_REQUEST
};

bool is_method_char(unsigned char ch) { return std::isalnum(ch) || ch == '_'; }

} // namespace

LogEntry::LogEntry()
    : original_line_number(0), valid(false), client_port(0),
      accept_date_ms(0), time_wait_request(0), time_wait_queues(0),
      time_connect_server(0), time_wait_response(0), total_time(0),
      status_code(0), bytes_read(0), active_connections(0),
      frontend_connections(0), backend_connections(0), server_connections(0),
      retries(0), queue_server(0), queue_backend(0) {}

void LogEntry::parse_request_details(std::string_view full_request_field,
                                     std::string &out_method,
                                     std::string &out_path,
                                     std::string &out_query,
                                     std::string &out_protocol) {
  // Find the first space for the method
  size_t method_end = full_request_field.find(' ');
  if (method_end == std::string_view::npos || method_end == 0)
    return; // "<BADREQ>" and friends carry no request details

  std::string_view method = full_request_field.substr(0, method_end);
  for (char ch : method)
    if (!is_method_char(static_cast<unsigned char>(ch)))
      return;

  std::string_view rest = full_request_field.substr(method_end);
  size_t target_start = rest.find_first_not_of(' ');
  if (target_start == std::string_view::npos) {
    out_method = std::string(method);
    return;
  }
  rest = rest.substr(target_start);

  // Protocol is the last token, only when it looks like one
  size_t protocol_start = rest.rfind(' ');
  if (protocol_start != std::string_view::npos &&
      rest.substr(protocol_start + 1).rfind("HTTP/", 0) == 0) {
    out_protocol = std::string(rest.substr(protocol_start + 1));
    rest = rest.substr(0, protocol_start);
    while (!rest.empty() && rest.back() == ' ')
      rest.remove_suffix(1);
  }

  std::string_view target = rest;
  size_t query_start = target.find('?');
  if (query_start != std::string_view::npos) {
    out_query = std::string(target.substr(query_start + 1));
    target = target.substr(0, query_start);
  }

  out_method = std::string(method);
  // Only origin-form ("/...") and asterisk-form targets count as paths
  if (target == "*" || (!target.empty() && target.front() == '/'))
    out_path = std::string(target);
}

std::optional<LogEntry> LogEntry::parse_from_string(std::string_view log_line,
                                                    uint64_t line_num,
                                                    bool verbose_warnings) {
  std::cmatch match;
  if (!std::regex_match(log_line.data(), log_line.data() + log_line.size(),
                        match, haproxy_line_regex())) {
    if (verbose_warnings)
      std::cerr << "Warning (Line " << line_num
                << "): Line does not match the HAProxy HTTP log format."
                << " Skipping line." << std::endl;
    return std::nullopt;
  }

  auto group = [&match, log_line](size_t index) {
    return log_line.substr(static_cast<size_t>(match.position(index)),
                           static_cast<size_t>(match.length(index)));
  };

  LogEntry entry;
  entry.original_line_number = line_num;

  entry.client_ip = std::string(group(CLIENT_IP));
  entry.raw_accept_date = std::string(group(ACCEPT_DATE));
  entry.frontend_name = std::string(group(FRONTEND));
  entry.backend_name = std::string(group(BACKEND));
  entry.server_name = std::string(group(SERVER));
  entry.captured_request_cookie = std::string(group(REQUEST_COOKIE));
  entry.captured_response_cookie = std::string(group(RESPONSE_COOKIE));
  entry.termination_state = std::string(group(TERMINATION_STATE));

  // Attempt to parse critical fields
  auto accept_date = Utils::convert_accept_date_to_ms(entry.raw_accept_date);
  if (!accept_date) {
    if (verbose_warnings)
      std::cerr << "Warning (Line " << line_num
                << "): Failed to parse accept date '" << entry.raw_accept_date
                << "'. Critical." << std::endl;
    return std::nullopt;
  }
  entry.accept_date_ms = *accept_date;

  auto client_port = Utils::string_to_number<int>(group(CLIENT_PORT));
  auto tq = Utils::string_to_number<int64_t>(group(TQ));
  auto tw = Utils::string_to_number<int64_t>(group(TW));
  auto tc = Utils::string_to_number<int64_t>(group(TC));
  auto tr = Utils::string_to_number<int64_t>(group(TR));
  auto tt = Utils::string_to_number<int64_t>(group(TT));
  auto status_code = Utils::string_to_number<int>(group(STATUS_CODE));
  auto bytes_read = Utils::string_to_number<uint64_t>(group(BYTES_READ));
  auto actconn = Utils::string_to_number<int>(group(ACTCONN));
  auto feconn = Utils::string_to_number<int>(group(FECONN));
  auto beconn = Utils::string_to_number<int>(group(BECONN));
  auto srv_conn = Utils::string_to_number<int>(group(SRV_CONN));
  auto retries = Utils::string_to_number<int>(group(RETRIES));
  auto queue_server = Utils::string_to_number<int>(group(QUEUE_SERVER));
  auto queue_backend = Utils::string_to_number<int>(group(QUEUE_BACKEND));

  if (!client_port || !tq || !tw || !tc || !tr || !tt || !status_code ||
      !bytes_read || !actconn || !feconn || !beconn || !srv_conn ||
      !retries || !queue_server || !queue_backend) {
    if (verbose_warnings)
      std::cerr << "Warning (Line " << line_num
                << "): Numeric field out of range. Critical." << std::endl;
    return std::nullopt;
  }

  entry.client_port = *client_port;
  entry.time_wait_request = *tq;
  entry.time_wait_queues = *tw;
  entry.time_connect_server = *tc;
  entry.time_wait_response = *tr;
  entry.total_time = *tt;
  entry.status_code = *status_code;
  entry.bytes_read = *bytes_read;
  entry.active_connections = *actconn;
  entry.frontend_connections = *feconn;
  entry.backend_connections = *beconn;
  entry.server_connections = *srv_conn;
  entry.retries = *retries;
  entry.queue_server = *queue_server;
  entry.queue_backend = *queue_backend;

  // A single captured block is always the request headers
  if (match[REQUEST_HEADERS].matched) {
    entry.captured_request_headers = std::string(group(REQUEST_HEADERS));
    entry.captured_response_headers = std::string(group(RESPONSE_HEADERS));
  } else if (match[ONLY_HEADERS].matched) {
    entry.captured_request_headers = std::string(group(ONLY_HEADERS));
  }

  entry.raw_http_request = std::string(group(HTTP_REQUEST));
  parse_request_details(entry.raw_http_request, entry.http_request_method,
                        entry.http_request_path, entry.http_request_query,
                        entry.http_request_protocol);

  entry.valid = true;
  return entry;
}
