#include <tsp_instance.hpp>
#include <tsp_utils.hpp>
#include <sstream>
#include <cmath>
#include <iostream>
#include <cstddef>

using std::size_t;

const city_id TSPInstance::invalid_city = -1;

/**
 * Erstellt eine euklidische Instanz aus den gegebenen Koordinaten. Stadt i hat die Koordinaten cities[i].
 */
TSPInstance::TSPInstance(const std::vector<City>& cities, std::string name)
		: cities(cities), name(std::move(name)) {
	resize(static_cast<city_id>(cities.size()));
	initFromCities();
}

/**
 * Erstellt eine Instanz mit expliziten Distanzen, matrix[a][b] ist die Länge der Kante von a nach b. Die Matrix muss
 * nicht symmetrisch sein.
 */
TSPInstance::TSPInstance(const std::vector<std::vector<cost_t>>& matrix, std::string name) : name(std::move(name)) {
	resize(static_cast<city_id>(matrix.size()));
	for (city_id from = 0; from < getCityCount(); ++from) {
		if (matrix[from].size() != matrix.size()) {
			throw InputError("Distance matrix row " + std::to_string(from) + " has " +
							 std::to_string(matrix[from].size()) + " entries, expected " +
							 std::to_string(matrix.size()));
		}
		for (city_id to = 0; to < getCityCount(); ++to) {
			cost_t dist = matrix[from][to];
			if (from != to && (!std::isfinite(dist) || dist < 0)) {
				throw InputError("Invalid distance from " + std::to_string(from) + " to " + std::to_string(to) +
								 ": " + std::to_string(dist));
			}
			distances[from][to] = from == to ? 0 : dist;
		}
	}
}

/**
 * Liest eine (A)TSP-Instanz im TSPLIB-Format ein. Unterstützt werden EUC_2D-Koordinaten und explizite Distanzen.
 * @param input Die Quelle der Eingabe
 */
TSPInstance::TSPInstance(std::istream& input) {
	std::string line;
	EdgeWeightType edgeType = euc_2d;
	EdgeFormat edgeFormat = full_matrix;
	bool symmetric = true;
	bool haveData = false;
	bool emptyLines = false;
	while (std::getline(input, line)) {
		if (!line.empty()) {
			if (emptyLines) {
				std::cout << "Skipped empty line(s)" << std::endl;
				emptyLines = false;
			}
			std::stringstream ss(line);
			std::string keyword = tsp_util::readKeyword(ss);
			if (keyword == "NAME") {
				ss >> name;
			} else if (keyword == "COMMENT") {
				//NOP
			} else if (keyword == "DIMENSION") {
				if (!distances.empty()) {
					throw InputError("DIMENSION was specified twice");
				}
				resize(tsp_util::readOrThrow<city_id>(ss));
			} else if (keyword == "EDGE_WEIGHT_TYPE") {
				auto type = tsp_util::readOrThrow<std::string>(ss);
				if (type == "EUC_2D") {
					edgeType = euc_2d;
				} else if (type == "EXPLICIT") {
					edgeType = explicit_;
				} else {
					throw InputError("Unsupported edge weight type: " + type);
				}
			} else if (keyword == "EDGE_WEIGHT_FORMAT") {
				auto type = tsp_util::readOrThrow<std::string>(ss);
				if (type == "FULL_MATRIX") {
					edgeFormat = full_matrix;
				} else if (type == "LOWER_DIAG_ROW") {
					edgeFormat = lower_diag_row;
				} else if (type == "UPPER_DIAG_ROW") {
					edgeFormat = upper_diag_row;
				} else if (type == "UPPER_ROW") {
					edgeFormat = upper_row;
				} else if (type != "FUNCTION") {
					throw InputError("Unknown edge format: " + type);
				}
			} else if (keyword == "NODE_COORD_SECTION" || keyword == "EDGE_WEIGHT_SECTION") {
				if (distances.empty()) {
					throw InputError(keyword + " found before DIMENSION");
				}
				if (haveData) {
					throw InputError("Instance contains more than one data section");
				}
				if (keyword == "NODE_COORD_SECTION") {
					if (edgeType != euc_2d) {
						throw InputError("Weight type is EXPLICIT, but a NODE_COORD_SECTION exists!");
					}
					readNodes(input);
				} else {
					if (edgeType != explicit_) {
						throw InputError("Weight type is EUC_2D, but an EDGE_WEIGHT_SECTION exists!");
					}
					readEdges(input, edgeFormat, symmetric);
				}
				haveData = true;
				input >> std::ws;
			} else if (keyword == "TYPE") {
				auto type = tsp_util::readOrThrow<std::string>(ss);
				if (type == "ATSP") {
					symmetric = false;
				} else if (type != "TSP") {
					throw InputError("Input is not a TSP or ATSP instance!");
				}
			} else if (keyword == "EOF") {
				break;
			} else {
				std::cout << "Unknown keyword found, ignoring: " << keyword << std::endl;
			}
		} else {
			emptyLines = true;
		}
	}
	if (!haveData) {
		throw InputError("Instance does not contain node coordinates or edge weights");
	}
	if (!symmetric && edgeFormat != full_matrix) {
		throw InputError("ATSP instances need EDGE_WEIGHT_FORMAT: FULL_MATRIX");
	}
}

void TSPInstance::resize(city_id cityCount) {
	if (cityCount < 2) {
		throw InputError("A tour needs at least 2 cities, got " + std::to_string(cityCount));
	}
	distances.assign(static_cast<size_t>(cityCount), std::vector<cost_t>(static_cast<size_t>(cityCount), 0));
}

void TSPInstance::initFromCities() {
	for (city_id i = 0; i < getCityCount(); ++i) {
		if (!std::isfinite(cities[i].x) || !std::isfinite(cities[i].y)) {
			throw InputError("City " + std::to_string(i) + " has a non-finite coordinate");
		}
	}
	for (city_id higherId = 1; higherId < getCityCount(); ++higherId) {
		for (city_id lowerId = 0; lowerId < higherId; ++lowerId) {
			cost_t dist = euclideanDistance(cities[lowerId], cities[higherId]);
			distances[lowerId][higherId] = dist;
			distances[higherId][lowerId] = dist;
		}
	}
}

void TSPInstance::readNodes(std::istream& input) {
	city_id nodeCount = getCityCount();
	cities.resize(static_cast<size_t>(nodeCount));
	//Wurde die Position eines gegebenen Knotens gesetzt?
	std::vector<bool> set(static_cast<size_t>(nodeCount), false);
	for (city_id iteration = 0; iteration < nodeCount; ++iteration) {
		auto id = tsp_util::readOrThrow<city_id>(input) - 1;
		if (id < 0 || id >= nodeCount) {
			throw InputError("Node id " + std::to_string(id + 1) + " is out of range");
		}
		City& c = cities[id];
		c.x = tsp_util::readOrThrow<double>(input);
		c.y = tsp_util::readOrThrow<double>(input);
		if (set[id]) {
			throw InputError("Location for city " + std::to_string(id + 1) + " was set twice");
		}
		set[id] = true;
	}
	initFromCities();
}

void TSPInstance::readEdges(std::istream& input, TSPInstance::EdgeFormat type, bool symmetric) {
	const city_id nodeCount = getCityCount();
	city_id rowCount = nodeCount;
	if (type == upper_row) {
		rowCount--;
	}
	for (city_id row = 0; row < rowCount; ++row) {
		//Die Spalte, der die erste Zahl entspricht
		city_id minCol = 0;
		//Die Anzahl der Spalten in dieser Zeile
		city_id colCount = 0;
		switch (type) {
			case full_matrix:
				colCount = nodeCount;
				break;
			case lower_diag_row:
				colCount = row + 1;
				break;
			case upper_diag_row:
				minCol = row;
				colCount = nodeCount - row;
				break;
			case upper_row:
				minCol = row + 1;
				colCount = nodeCount - row - 1;
				break;
		}
		for (city_id col = minCol; col < minCol + colCount; ++col) {
			auto dist = tsp_util::readOrThrow<cost_t>(input);
			if (row == col) {
				continue;
			}
			if (!std::isfinite(dist) || dist < 0) {
				throw InputError("Invalid edge weight " + std::to_string(dist));
			}
			distances[row][col] = dist;
			if (symmetric) {
				distances[col][row] = dist;
			}
		}
	}
}

/**
 * Wirft einen InputError, falls id keine Stadt dieser Instanz ist
 */
void TSPInstance::checkCity(city_id id) const {
	if (id < 0 || id >= getCityCount()) {
		throw InputError("City index " + std::to_string(id) + " is not in [0, " + std::to_string(getCityCount()) +
						 ")");
	}
}

const City& TSPInstance::getCity(city_id id) const {
	checkCity(id);
	if (!hasCoordinates()) {
		throw InputError("Instance " + name + " has explicit distances, no coordinates");
	}
	return cities[id];
}

bool TSPInstance::hasCoordinates() const {
	return !cities.empty();
}

bool TSPInstance::isSymmetric() const {
	for (city_id a = 1; a < getCityCount(); ++a) {
		for (city_id b = 0; b < a; ++b) {
			if (distances[a][b] != distances[b][a]) {
				return false;
			}
		}
	}
	return true;
}

std::string TSPInstance::getName() const {
	return name;
}

cost_t TSPInstance::euclideanDistance(const City& a, const City& b) {
	double distX = a.x - b.x;
	double distY = a.y - b.y;
	return std::sqrt(distX * distX + distY * distY);
}
