#ifndef CITY_GENERATOR_HPP
#define CITY_GENERATOR_HPP

#include <cstdint>
#include <vector>
#include <tsp_instance.hpp>

namespace citygen {
	std::vector<City> generateCities(city_id count, double size, std::uint32_t seed);
}

#endif
