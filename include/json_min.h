// include/json_min.h
#pragma once
#include <string>

namespace panes {

std::string jsonEscape(const std::string& s);
std::string utf8(const std::wstring& ws); // wchar_t code points -> UTF-8
std::wstring widen(const std::string& s); // UTF-8 -> wchar_t, bad bytes -> U+FFFD

} // namespace panes
