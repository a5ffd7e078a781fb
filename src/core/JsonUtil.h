#pragma once
#include <string>
#include <chrono>

namespace plug_scan {
namespace jsonutil {

std::string escape(const std::string& s);
// ISO-8601 UTC ("2023-12-25T12:30:45Z"); empty for an unset (epoch) time point.
std::string time_to_iso(std::chrono::system_clock::time_point tp);
// Fixed one-decimal number text ("12.5").
std::string fixed1(double v);
// Human duration: "4.2s" below a minute, "3.5m" below an hour, else "1.2h".
std::string format_duration(double seconds);

}
}
