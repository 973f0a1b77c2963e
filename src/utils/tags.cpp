#include "rowcast/utils/tags.hpp"

#include <cctype>

namespace rowcast::utils {

std::string normalizeTag(std::string_view tag) {
	while (!tag.empty() && std::isspace(static_cast<unsigned char>(tag.front()))) {
		tag.remove_prefix(1);
	}
	while (!tag.empty() && std::isspace(static_cast<unsigned char>(tag.back()))) {
		tag.remove_suffix(1);
	}
	std::string normalized;
	normalized.reserve(tag.size());
	for (char c : tag) {
		if (c == '-' || c == ' ') {
			normalized.push_back('_');
		} else {
			normalized.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
		}
	}
	return normalized;
}

} // namespace rowcast::utils
