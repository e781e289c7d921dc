#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace util {

// Environment variable helpers
std::string get_env_var(const std::string& name, const std::string& default_value = "");
int get_env_int(const std::string& name, int default_value);

// String utilities
std::vector<std::string> split_csv_line(const std::string& line, char delimiter = ',');
std::string strip_line_ending(const std::string& line);

// Civil time (proleptic Gregorian, UTC)
bool is_leap_year(int year);
int days_in_month(int year, int month);
int64_t days_from_civil(int year, unsigned month, unsigned day);
int64_t to_epoch_seconds(int year, int month, int day, int hour, int minute, int second);

// Parses "YYYY.MM.DD HH:MM:SS" strictly; nullopt on any deviation.
std::optional<int64_t> parse_bar_timestamp(const std::string& text);

// Time formatting
std::string format_iso8601_utc(int64_t epoch_seconds);
std::string current_iso8601();

// Number parsing, whole string must be consumed
std::optional<double> parse_double(const std::string& text);
std::optional<int64_t> parse_int64(const std::string& text);

} // namespace util
