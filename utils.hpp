#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <spdlog/spdlog.h>


namespace Utils
{
    class Timer
    {
        public:
            Timer(): start_time(std::chrono::steady_clock::now()) {}

            double stop() const
            {
                auto end_time = std::chrono::steady_clock::now();
                return std::chrono::duration<double, std::milli>(end_time - start_time).count();
            }

        private:
            std::chrono::time_point<std::chrono::steady_clock> start_time;
    };

    template<typename Func, typename... Args>
    auto measureTime(Func func, Args&&... args)
    {
        Timer timer;
        auto result = func(std::forward<Args>(args)...);
        double elapsed_time = timer.stop();
        return std::make_pair(elapsed_time, result);
    }


    template <typename Func, typename... Args>
    auto measureTimeWithMessage(std::string_view startMessage, Func func, Args&&... args)
    {
        spdlog::info(startMessage);
        auto [time, result] = measureTime(func, std::forward<Args>(args)...);
        spdlog::debug("Execution time: {}ms", time);
        return result;
    }

    // Value of environment variable, empty optional when it is not set
    std::optional<std::string> environmentValue(const char* name);
}
