#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <functional>
#include <iostream>
#include <limits>
#include <memory>
#include <numeric>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <fplus/fplus.hpp>
#include <reproc++/drain.hpp>
#include <reproc++/reproc.hpp>
#include <spdlog/spdlog.h>

namespace fwd = fplus::fwd;

inline constexpr size_t MIN_BENCHMARK_SECONDS = 3UZ;
inline constexpr size_t MIN_BENCHMARK_TIMES = 5UZ;
inline constexpr int TIMEOUT_MILLISECONDS = 300'000;

// "insertion throughput" is measured by the executable "BM_insertion_throughput"
inline auto get_benchmark_filename(const std::string &name) -> std::string {
  return fplus::replace_elems(' ', '_', name);
}

inline auto get_current_time_in_seconds() -> double {
  const auto now = std::chrono::high_resolution_clock::now();
  const auto duration = now.time_since_epoch();
  return std::chrono::duration_cast<std::chrono::duration<double>>(duration).count();
}

template <typename T>
concept ConvertibleToString = std::is_integral_v<std::remove_cvref_t<T>> ||
                              std::is_same_v<std::remove_cvref_t<T>, std::string>;

auto convert_to_string(ConvertibleToString auto &&value) -> std::string {
  using T = std::decay_t<decltype(value)>;
  if constexpr (std::is_integral_v<T>)
    return std::to_string(value);
  else
    return std::string(value);
}

/**
 * @brief Result of running a task executable once.
 */
struct TaskRun {
  bool ok = false;
  double value = std::numeric_limits<double>::infinity();
  std::string output;
};

/**
 * @brief Run a task executable to completion and capture its stdout and stderr.
 *
 * @param args The command line, executable first.
 * @return The run. `ok` is false if the process could not be run or exited with a non-zero status.
 */
inline auto run_task(const std::vector<std::string> &args) -> TaskRun {
  TaskRun run;

  reproc::process process;
  reproc::options options;
  options.redirect.out.type = reproc::redirect::pipe;
  options.redirect.err.type = reproc::redirect::pipe;

  std::error_code ec = process.start(args, options);
  if (ec) {
    run.output = "failed to start: " + ec.message();
    return run;
  }

  reproc::sink::string sink(run.output);
  ec = reproc::drain(process, sink, sink);
  if (ec) {
    run.output = "failed to read output: " + ec.message();
    return run;
  }

  int status = 0;
  std::tie(status, ec) = process.wait(reproc::milliseconds{TIMEOUT_MILLISECONDS});
  if (ec) {
    run.output = "failed to wait: " + ec.message();
    return run;
  }
  if (status != 0) {
    run.output = fmt::format("exited with status {}: {}", status,
                             fplus::trim_whitespace(run.output));
    return run;
  }

  std::istringstream iss(run.output);
  iss >> run.value;
  run.ok = !iss.fail();
  return run;
}

class BenchmarkBase {
public:
  BenchmarkBase(const BenchmarkBase &) = delete;
  BenchmarkBase(BenchmarkBase &&) = delete;
  auto operator=(const BenchmarkBase &) -> BenchmarkBase & = delete;
  auto operator=(BenchmarkBase &&) -> BenchmarkBase & = delete;
  explicit BenchmarkBase(std::string name)
      : name(std::move(name)), executable_("./BM_" + get_benchmark_filename(this->name)) {}
  virtual ~BenchmarkBase() = default;

  virtual void run() = 0;

  /**
   * @brief Run every task of the benchmark with the given arguments, repeating each one until it
   * ran at least `MIN_BENCHMARK_TIMES` times and `MIN_BENCHMARK_SECONDS` seconds, and record the
   * mean of each task.
   */
  template <ConvertibleToString... Args> void benchmark_all(Args &&...args) {
    const std::vector<std::string> arguments{convert_to_string(std::forward<Args>(args))...};

    std::vector<double> means;
    for (const std::string &task : tasks_) {
      std::vector<std::string> command{executable_, task};
      command.insert(command.end(), arguments.begin(), arguments.end());
      spdlog::debug("[{}] Running benchmark with command: {}", task,
                    fplus::join(std::string(" "), command));

      std::vector<double> values;
      const double start = get_current_time_in_seconds();
      size_t times = 0;
      for (; times < MIN_BENCHMARK_TIMES ||
             get_current_time_in_seconds() - start < MIN_BENCHMARK_SECONDS;
           times++) {
        const TaskRun run = run_task(command);
        if (!run.ok) {
          spdlog::error("[{}/{}] {}", task, times + 1, run.output);
          break;
        }
        values.push_back(run.value);
      }

      const double mean = values.empty()
                              ? std::numeric_limits<double>::infinity()
                              : std::accumulate(values.begin(), values.end(), 0.0) /
                                    static_cast<double>(values.size());
      spdlog::debug("[{}] Benchmark ran {} times. Mean: {}", task, times, mean);
      means.push_back(mean);
    }

    results_.emplace_back(arguments, means);
  }

  /**
   * @brief Print the recorded results as a table, one row per `benchmark_all` call and one column
   * per task.
   */
  void summarize(const std::function<std::string(const std::vector<std::string> &)> &index_formatter,
                 const std::function<std::string(double, const std::vector<std::string> &)>
                     &value_formatter) const {
    std::vector<std::vector<std::string>> rows;
    for (const auto &[arguments, means] : results_) {
      std::vector<std::string> row{index_formatter(arguments)};
      for (const double mean : means)
        row.push_back(value_formatter(mean, arguments));
      rows.push_back(row);
    }

    size_t index_width = std::string("Elements").size();
    size_t value_width = 0;
    for (const std::string &task : tasks_)
      value_width = std::max(value_width, task.size());
    for (const auto &row : rows) {
      index_width = std::max(index_width, row[0].size());
      for (size_t i = 1; i < row.size(); i++)
        value_width = std::max(value_width, row[i].size());
    }
    index_width += 2;
    value_width += 2;

    std::string header = fmt::format("{:<{}}", "Elements", index_width);
    for (const std::string &task : tasks_)
      header += fmt::format("{:<{}}", task, value_width);
    spdlog::info(header);

    for (const auto &row : rows) {
      std::string line = fmt::format("{:<{}}", row[0], index_width);
      for (size_t i = 1; i < row.size(); i++)
        line += fmt::format("{:<{}}", row[i], value_width);
      spdlog::info(line);
    }
  }

  void start() {
    tasks_ = get_available_tasks();
    run();
    std::cout << std::endl;
  }

protected:
  // NOLINTNEXTLINE
  std::string name;

private:
  std::string executable_;
  std::vector<std::string> tasks_;
  std::vector<std::pair<std::vector<std::string>, std::vector<double>>> results_;

  /**
   * @brief Ask the task executable for its tasks. Run without arguments it prints
   * "Usage: <executable> {A|B|C} ...".
   */
  [[nodiscard]] auto get_available_tasks() const -> std::vector<std::string> {
    const TaskRun run = run_task({executable_});
    // The usage message comes with a non-zero exit status
    const std::string output = fplus::trim_whitespace(run.output);
    const auto usage = output.find("Usage: ");
    if (usage == std::string::npos)
      throw std::runtime_error("Unexpected output from " + executable_ + ": " + output);

    return fwd::apply(output.substr(usage), fwd::split(' ', false), fwd::elem_at_idx(2),
                      fwd::drop(1), fwd::drop_last(1), fwd::split('|', false));
  }
};

inline std::vector<std::unique_ptr<BenchmarkBase>> benchmarks;

// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define CONCAT(a, b) CONCAT_INNER(a, b)
#define CONCAT_INNER(a, b) a##b

// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define BENCHMARK(name)                                                                            \
  class CONCAT(Benchmark, __LINE__) : public BenchmarkBase {                                       \
  public:                                                                                          \
    CONCAT(Benchmark, __LINE__)() : BenchmarkBase(name) {}                                         \
    void run() override;                                                                           \
  };                                                                                               \
  static bool CONCAT(CONCAT(_benchmark, __LINE__), _registered) = [] {                             \
    benchmarks.emplace_back(std::make_unique<CONCAT(Benchmark, __LINE__)>());                      \
    return true;                                                                                   \
  }();                                                                                             \
  void CONCAT(Benchmark, __LINE__)::run()

inline auto benchmark_main() -> int {
  for (const auto &benchmark : benchmarks) {
    try {
      benchmark->start();
    } catch (const std::exception &e) {
      spdlog::error("Benchmark failed: {}", e.what());
      return 1;
    }
  }

  return 0;
}

#define BENCHMARK_MAIN                                                                             \
  auto benchmark_main_impl() -> int;                                                               \
  auto main() -> int {                                                                             \
    const int res = benchmark_main_impl();                                                         \
    if (res != 0)                                                                                  \
      return res;                                                                                  \
    return benchmark_main();                                                                       \
  }                                                                                                \
  auto benchmark_main_impl() -> int
