#ifndef TSP_UTILS_HPP
#define TSP_UTILS_HPP

#include <istream>
#include <string>
#include <utility>
#include <vector>
#include <tsp_errors.hpp>

namespace tsp_util {
	std::string readKeyword(std::istream& in);

	bool isPermutation(const std::vector<city_id>& order, city_id cityCount);

	std::pair<std::string, std::string> splitOption(const std::string& arg);

	/**
	 * @tparam T Der Typ des zu lesenden Wertes
	 * @return Den nächsten Wert aus input, ein InputError falls dieser fehlt oder nicht als T lesbar ist
	 */
	template<typename T>
	T readOrThrow(std::istream& input);
}

template<typename T>
T tsp_util::readOrThrow(std::istream& input) {
	T value;
	if (!(input >> value)) {
		throw InputError("Unexpected end of input or malformed value");
	}
	return value;
}

#endif
