#pragma once
#include <chrono>
#include <string>
#include <vector>

std::string trim(const std::string& s);
std::string to_lower(std::string s);   // ASCII only

// Splits on '\n' and drops a trailing '\r' from each line.
std::vector<std::string> split_lines(const std::string& s);

// "2026-10-17T09:30:00" in UTC
std::string iso_time(std::chrono::system_clock::time_point tp);
std::chrono::system_clock::time_point parse_iso_time(const std::string& s);
