#include <city_generator.hpp>
#include <cmath>
#include <random>
#include <string>

/**
 * Erzeugt count gleichverteilte Städte im Quadrat [0, size)². Gleicher Seed ergibt immer dieselben Städte.
 */
std::vector<City> citygen::generateCities(city_id count, double size, std::uint32_t seed) {
	if (count < 2) {
		throw InputError("A tour needs at least 2 cities, got " + std::to_string(count));
	}
	if (!std::isfinite(size) || size <= 0) {
		throw InputError("Size of the square must be positive, got " + std::to_string(size));
	}
	std::mt19937 generator(seed);
	std::uniform_real_distribution<double> coordinate(0, size);
	std::vector<City> ret(static_cast<std::size_t>(count));
	for (City& c:ret) {
		c.x = coordinate(generator);
		c.y = coordinate(generator);
	}
	return ret;
}
