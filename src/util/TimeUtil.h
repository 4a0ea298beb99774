#pragma once

#include <cstdint>
#include <string>
#include <ctime>

namespace TimeUtil {

int64_t NowTs();
std::tm LocalTime(time_t ts);
std::string FormatTimestamp(time_t ts); // YYYY-MM-DD HH:MM:SS, local
std::string TodayDate(); // YYYY-MM-DD, local

// Strict YYYY-MM-DD with calendar validation.
bool ParseDate(const std::string& text, int* year, int* month, int* day);
bool IsValidDate(const std::string& text);

std::string FormatDisplayDate(const std::string& date_iso); // DD/MM/YYYY
std::string AddDays(const std::string& date_iso, int days);
uint32_t DateSeed(const std::string& date_iso); // YYYYMMDD as an integer

int DaysInMonth(int year, int month); // month: 1-12
}
