#ifndef TSP_INSTANCE_HPP
#define TSP_INSTANCE_HPP

#include <istream>
#include <string>
#include <utility>
#include <vector>
#include <tsp_errors.hpp>

using cost_t = double;
using Arc = std::pair<city_id, city_id>;

struct City {
	double x, y;
};

/**
 * Eine (A)TSP-Instanz: die Anzahl der Städte, ggf. deren Koordinaten und die Distanzen aller gerichteten Kanten.
 * Nach der Konstruktion unveränderlich.
 */
class TSPInstance {
public:
	explicit TSPInstance(const std::vector<City>& cities, std::string name = "cities");

	TSPInstance(const std::vector<std::vector<cost_t>>& matrix, std::string name);

	explicit TSPInstance(std::istream& in);

	inline cost_t getDistance(city_id from, city_id to) const;

	inline cost_t getDistance(const Arc& arc) const;

	inline city_id getCityCount() const;

	inline int getArcCount() const;

	const City& getCity(city_id id) const;

	bool hasCoordinates() const;

	bool isSymmetric() const;

	std::string getName() const;

	void checkCity(city_id id) const;

	static cost_t euclideanDistance(const City& a, const City& b);

	static const city_id invalid_city;

private:
	enum EdgeWeightType {
		euc_2d,
		explicit_
	};
	enum EdgeFormat {
		full_matrix,
		lower_diag_row,
		upper_diag_row,
		upper_row
	};

	void initFromCities();

	void resize(city_id cityCount);

	void readNodes(std::istream& input);

	void readEdges(std::istream& input, EdgeFormat type, bool symmetric);

	//distances[a][b] ist die Länge der Kante von a nach b
	std::vector<std::vector<cost_t>> distances;
	//Leer, falls die Distanzen explizit angegeben wurden
	std::vector<City> cities;
	//Der Name der Instanz
	std::string name;
};

city_id TSPInstance::getCityCount() const {
	return static_cast<city_id>(distances.size());
}

int TSPInstance::getArcCount() const {
	city_id size = getCityCount();
	return size * (size - 1);
}

cost_t TSPInstance::getDistance(city_id from, city_id to) const {
	checkCity(from);
	checkCity(to);
	return distances[from][to];
}

cost_t TSPInstance::getDistance(const Arc& arc) const {
	return getDistance(arc.first, arc.second);
}

#endif
