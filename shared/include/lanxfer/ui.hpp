#pragma once

#include <chrono>
#include <cstdint>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>

#include "lanxfer/progress.hpp"

namespace lanxfer {

enum class Severity { Info, Success, Warning, Error };

// Operator facing surface. The transfer core only ever sees ProgressCallback;
// the executables adapt it onto one of these.
class Ui {
public:
  virtual ~Ui() = default;

  virtual void render_progress(const ProgressSnapshot& snapshot) = 0;
  virtual std::string prompt_line(const std::string& text) = 0;
  virtual void notify(const std::string& message, Severity severity) = 0;
};

class ConsoleUi : public Ui {
public:
  explicit ConsoleUi(std::ostream& out = std::cout, std::istream& in = std::cin);

  void render_progress(const ProgressSnapshot& snapshot) override;
  std::string prompt_line(const std::string& text) override;
  void notify(const std::string& message, Severity severity) override;

private:
  void end_line_locked();

  std::mutex mutex_;
  std::ostream& out_;
  std::istream& in_;
  bool line_open_ = false;
};

// 1536 -> "1.5 KB"
std::string format_size(std::uint64_t bytes);
// nullopt -> "--:--:--"
std::string format_eta(const std::optional<std::chrono::seconds>& eta);

} // namespace lanxfer
