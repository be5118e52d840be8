#pragma once
/** @file  TimeUtils.hpp
 *  @brief Spoken-form clock and calendar answers.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <ctime>
#include <functional>
#include <string>

namespace genesis::services {

  class TimeUtils {
  public:
    virtual ~TimeUtils() = default;
    virtual std::string tellTime() const = 0;
    virtual std::string tellDate() const = 0;
  };

  /// Local wall clock. The clock is injectable for tests.
  class SystemTimeUtils : public TimeUtils {
  public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    explicit SystemTimeUtils(Clock clock = [] { return std::chrono::system_clock::now(); });

    std::string tellTime() const override;
    std::string tellDate() const override;

    /// "It is 3:05 PM."
    static std::string formatTime(const std::tm& local);
    /// "Today is Friday, October 17, 2026."
    static std::string formatDate(const std::tm& local);

  private:
    std::tm now() const;

    Clock clock_;
  };

} // namespace genesis::services
