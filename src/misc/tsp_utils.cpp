#include <tsp_utils.hpp>
#include <cstddef>
#include <ios>

/**
 * Liest das Schlüsselwort einer TSPLIB-Zeile und entfernt den folgenden Doppelpunkt. Dieser kann durch Leerzeichen
 * abgetrennt sein oder direkt am Schlüsselwort stehen, auch ohne Leerzeichen vor dem Wert ("DIMENSION:4"). Danach
 * steht in auf dem Wert.
 * @param in Eine Zeile der Eingabe, muss seekg unterstützen
 */
std::string tsp_util::readKeyword(std::istream& in) {
	std::string keyword;
	in >> keyword;
	std::size_t colon = keyword.find(':');
	if (colon != std::string::npos) {
		//Alles hinter dem Doppelpunkt gehört zum Wert
		auto valueLength = static_cast<std::streamoff>(keyword.size() - colon - 1);
		if (valueLength > 0) {
			in.clear();
			in.seekg(-valueLength, std::ios_base::cur);
		}
		keyword.erase(colon);
	} else if ((in >> std::ws).peek() == ':') {
		in.get();
	}
	return keyword;
}

/**
 * @return true genau dann, wenn order jede der Städte 0, ..., cityCount-1 genau einmal enthält
 */
bool tsp_util::isPermutation(const std::vector<city_id>& order, city_id cityCount) {
	if (order.size() != static_cast<std::size_t>(cityCount)) {
		return false;
	}
	std::vector<bool> seen(order.size(), false);
	for (city_id c:order) {
		if (c < 0 || c >= cityCount || seen[c]) {
			return false;
		}
		seen[c] = true;
	}
	return true;
}

/**
 * Zerlegt eine Option der Form key=value
 * @return key und value, oder ein leeres Paar, falls arg nicht genau ein '=' enthält
 */
std::pair<std::string, std::string> tsp_util::splitOption(const std::string& arg) {
	std::size_t pos = arg.find('=');
	if (pos == std::string::npos || pos == 0 || arg.find('=', pos + 1) != std::string::npos) {
		return {};
	}
	return {arg.substr(0, pos), arg.substr(pos + 1)};
}
