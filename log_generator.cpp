#include <algorithm>
#include <array>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <iostream>
#include <random>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

// Usage: haplog_generator [output_path] [total_lines] [malformed_percent]
size_t TOTAL_LINES = 200'000;
double MALFORMED_PERCENT = 0.02;

std::mt19937 rng(std::random_device{}());
std::uniform_real_distribution<> prob(0.0, 1.0);
std::uniform_int_distribution<> port_dist(1024, 65535);
std::uniform_int_distribution<> status_dist(0, 9);
std::uniform_int_distribution<> server_dist(0, 4);
std::uniform_int_distribution<> request_dist(0, 5);
std::uniform_int_distribution<> client_dist(0, 39);
std::uniform_int_distribution<> malformed_type(0, 4);
std::exponential_distribution<> response_time_dist(1.0 / 250.0);

const std::array<std::string, 10> statuses = {"200", "200", "200", "201", "204",
                                              "301", "304", "404", "500", "503"};
const std::array<std::string, 5> servers = {"app01", "app02", "app03", "app04",
                                            "<NOSRV>"};
const std::array<std::string, 6> requests = {
    "GET / HTTP/1.1",
    "GET /api/items?page=2 HTTP/1.1",
    "POST /api/login HTTP/1.1",
    "GET /static/app.js HTTP/1.1",
    "DELETE /api/items/42 HTTP/1.1",
    "<BADREQ>"};
const std::array<std::string, 12> months = {"Jan", "Feb", "Mar", "Apr",
                                            "May", "Jun", "Jul", "Aug",
                                            "Sep", "Oct", "Nov", "Dec"};

std::vector<std::string> client_pool;

std::string random_ip() {
  return std::to_string(rng() % 256) + "." + std::to_string(rng() % 256) + "." +
         std::to_string(rng() % 256) + "." + std::to_string(rng() % 256);
}

std::string accept_date(uint64_t epoch_ms) {
  std::time_t seconds = static_cast<std::time_t>(epoch_ms / 1000);
  std::tm *gmt = std::gmtime(&seconds);
  char buffer[40];
  std::snprintf(buffer, sizeof(buffer), "%02d/%s/%04d:%02d:%02d:%02d.%03u",
                gmt->tm_mday, months[gmt->tm_mon].c_str(),
                gmt->tm_year + 1900, gmt->tm_hour, gmt->tm_min, gmt->tm_sec,
                static_cast<unsigned>(epoch_ms % 1000));
  return buffer;
}

std::string syslog_prefix(uint64_t epoch_ms) {
  std::time_t seconds = static_cast<std::time_t>(epoch_ms / 1000);
  std::tm *gmt = std::gmtime(&seconds);
  char buffer[32];
  std::strftime(buffer, sizeof(buffer), "%b %e %H:%M:%S", gmt);
  return buffer;
}

// Queue depth drifts in short bursts, mostly sitting at zero
int next_queue_depth(int previous) {
  if (previous == 0)
    return prob(rng) < 0.03 ? 1 : 0;
  double p = prob(rng);
  if (p < 0.35)
    return previous + 1;
  if (p < 0.7)
    return previous - 1;
  return previous;
}

std::string generate_log_line(uint64_t accept_ms, int queue_backend) {
  int64_t tr = static_cast<int64_t>(response_time_dist(rng));
  int64_t tw = queue_backend > 0 ? static_cast<int64_t>(rng() % 200) : 0;
  int64_t tt = tr + tw + static_cast<int64_t>(rng() % 20);
  const std::string &server = servers[server_dist(rng)];
  uint64_t logged_ms = accept_ms + static_cast<uint64_t>(tt);

  std::ostringstream oss;
  oss << syslog_prefix(logged_ms) << " lb01 haproxy[" << 2000 + rng() % 100
      << "]: " << random_ip() << ":" << port_dist(rng) << " ["
      << accept_date(accept_ms) << "] http-in "
      << (server == "<NOSRV>" ? "http-in" : "web") << "/" << server << " "
      << rng() % 10 << "/" << tw << "/" << rng() % 5 << "/" << tr << "/" << tt
      << " " << statuses[status_dist(rng)] << " " << rng() % 50000 + 100
      << " - - ---- " << 10 + rng() % 90 << "/" << 10 + rng() % 90 << "/"
      << rng() % 20 << "/" << rng() % 5 << "/0 0/" << queue_backend;

  if (prob(rng) > 0.05)
    oss << " {" << client_pool[client_dist(rng)] << "}";

  oss << " \"" << requests[request_dist(rng)] << "\"";
  return oss.str();
}

std::string generate_malformed_line(const std::string &base) {
  switch (malformed_type(rng)) {
  case 0:
    return "completely malformed garbage text";
  case 1:
    return base.substr(0, base.size() / 2);
  case 2: {
    // Accept date that cannot exist
    std::string broken = base;
    size_t open = broken.find('[');
    if (open != std::string::npos)
      broken.replace(open + 1, 2, "99");
    return broken;
  }
  case 3:
    return "";
  default: {
    std::string broken = base;
    std::replace(broken.begin(), broken.end(), '/', ' ');
    return broken;
  }
  }
}

int main(int argc, char *argv[]) {
  std::string output_path = "./data/haproxy.log";
  if (argc > 1)
    output_path = argv[1];
  if (argc > 2)
    TOTAL_LINES = std::stoul(argv[2]);
  if (argc > 3)
    MALFORMED_PERCENT = std::stod(argv[3]) / 100.0;

  std::ofstream file(output_path);
  if (!file) {
    std::cerr << "Could not open output file: " << output_path << "\n";
    return 1;
  }

  for (int i = 0; i < 40; ++i)
    client_pool.push_back(random_ip());

  uint64_t accept_ms = 1386593986633ULL; // 09/Dec/2013:12:59:46.633
  int queue_backend = 0;

  // Lines are written in completion order: accept date plus total time.
  // Keep a small buffer and flush the earliest completion first so that the
  // file is out of accept order, like a real HAProxy log.
  std::vector<std::pair<uint64_t, std::string>> pending;

  for (size_t i = 1; i <= TOTAL_LINES; ++i) {
    accept_ms += rng() % 40;
    queue_backend = next_queue_depth(queue_backend);

    std::string line = generate_log_line(accept_ms, queue_backend);
    if (prob(rng) < MALFORMED_PERCENT)
      line = generate_malformed_line(line);

    uint64_t completed_ms =
        accept_ms + static_cast<uint64_t>(response_time_dist(rng));
    pending.emplace_back(completed_ms, std::move(line));

    if (pending.size() >= 64) {
      auto earliest = std::min_element(pending.begin(), pending.end());
      file << earliest->second << "\n";
      pending.erase(earliest);
    }

    if (i % 100000 == 0)
      std::cout << "Written: " << i << " lines\n";
  }

  std::sort(pending.begin(), pending.end());
  for (const auto &entry : pending)
    file << entry.second << "\n";

  file.close();
  std::cout << "Log generation completed.\n";
  return 0;
}
