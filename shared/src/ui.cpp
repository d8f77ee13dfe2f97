#include "lanxfer/ui.hpp"

#include <iomanip>
#include <sstream>

namespace lanxfer {

namespace {

constexpr int kBarWidth = 30;

const char* prefix(Severity severity) {
  switch (severity) {
  case Severity::Info:    return "[info] ";
  case Severity::Success: return "[ok] ";
  case Severity::Warning: return "[warn] ";
  case Severity::Error:   return "[error] ";
  }
  return "";
}

} // namespace

std::string format_size(std::uint64_t bytes) {
  if (bytes == 0) return "0 B";
  static const char* units[] = {"B", "KB", "MB", "GB", "TB", "PB"};
  double size = static_cast<double>(bytes);
  for (const char* unit : units) {
    if (size < 1024.0) {
      std::ostringstream oss;
      oss << std::fixed << std::setprecision(1) << size << ' ' << unit;
      return oss.str();
    }
    size /= 1024.0;
  }
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(1) << size << " EB";
  return oss.str();
}

std::string format_eta(const std::optional<std::chrono::seconds>& eta) {
  if (!eta) return "--:--:--";
  const long long total = eta->count();
  std::ostringstream oss;
  oss << std::setfill('0') << std::setw(2) << total / 3600 << ':'
      << std::setw(2) << (total % 3600) / 60 << ':'
      << std::setw(2) << total % 60;
  return oss.str();
}

ConsoleUi::ConsoleUi(std::ostream& out, std::istream& in) : out_(out), in_(in) {}

void ConsoleUi::render_progress(const ProgressSnapshot& s) {
  std::lock_guard<std::mutex> lock(mutex_);

  const int pos = static_cast<int>(s.fraction * kBarWidth);
  out_ << '\r' << s.label << " [";
  for (int i = 0; i < kBarWidth; ++i) {
    if (i < pos) out_ << '=';
    else if (i == pos) out_ << '>';
    else out_ << ' ';
  }
  out_ << "] " << std::fixed << std::setprecision(1) << s.fraction * 100.0 << "% "
       << format_size(s.bytes_done) << '/' << format_size(s.bytes_total) << " | "
       << format_size(static_cast<std::uint64_t>(s.throughput)) << "/s | ETA "
       << format_eta(s.eta) << "   " << std::flush;
  line_open_ = true;

  if (s.finished) end_line_locked();
}

std::string ConsoleUi::prompt_line(const std::string& text) {
  std::lock_guard<std::mutex> lock(mutex_);
  end_line_locked();
  out_ << text << std::flush;
  std::string line;
  if (!std::getline(in_, line)) return {};
  return line;
}

void ConsoleUi::notify(const std::string& message, Severity severity) {
  std::lock_guard<std::mutex> lock(mutex_);
  end_line_locked();
  out_ << prefix(severity) << message << '\n' << std::flush;
}

void ConsoleUi::end_line_locked() {
  if (line_open_) {
    out_ << '\n';
    line_open_ = false;
  }
}

} // namespace lanxfer
