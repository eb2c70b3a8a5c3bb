#pragma once
#include <chrono>
#include <cstdint>
#include <string>

// "2024-05-01T12:30:05.123456+00:00"
std::string format_utc(std::chrono::system_clock::time_point tp);
std::string format_utc(int64_t seconds, int64_t nanoseconds);

int64_t to_epoch_millis(std::chrono::system_clock::time_point tp);
std::chrono::system_clock::time_point from_epoch_millis(int64_t millis);
