#pragma once

#include <cstring>

namespace Estuary {

inline bool IsEnvFalseValue(const char* value) {
	if (!value || !value[0]) return false;
	return std::strcmp(value, "0") == 0 ||
	       std::strcmp(value, "false") == 0 ||
	       std::strcmp(value, "FALSE") == 0 ||
	       std::strcmp(value, "no") == 0 ||
	       std::strcmp(value, "NO") == 0 ||
	       std::strcmp(value, "off") == 0 ||
	       std::strcmp(value, "OFF") == 0;
}

inline bool IsEnvTrueValue(const char* value) {
	if (!value || !value[0]) return false;
	return std::strcmp(value, "1") == 0 ||
	       std::strcmp(value, "true") == 0 ||
	       std::strcmp(value, "TRUE") == 0 ||
	       std::strcmp(value, "yes") == 0 ||
	       std::strcmp(value, "YES") == 0 ||
	       std::strcmp(value, "on") == 0 ||
	       std::strcmp(value, "ON") == 0;
}

}  // namespace Estuary
