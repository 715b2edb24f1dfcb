#ifndef TSP_SOLUTION_HPP
#define TSP_SOLUTION_HPP

#include <tsp_instance.hpp>
#include <lemon/full_graph.h>
#include <istream>
#include <ostream>
#include <vector>

class TspMipData;

/**
 * Eine Tour durch alle Städte einer Instanz. Die Reihenfolge beginnt beim Anker, die letzte Stadt ist implizit
 * wieder mit dem Anker verbunden.
 */
class TSPSolution {
public:
	TSPSolution() = default;

	TSPSolution(const TSPInstance& inst, const std::vector<double>& variables, const TspMipData& variableMap,
				double reportedObjective, MipStatus reportedStatus);

	TSPSolution(const TSPInstance& inst, std::vector<city_id> order);

	TSPSolution(const TSPInstance& instance, std::istream& input);

	void write(std::ostream& out) const;

	cost_t getCost() const;

	const std::vector<city_id>& getOrder() const;

	std::vector<Arc> getArcs() const;

	TSPSolution reversed() const;

	TSPSolution rotatedTo(city_id anchor) const;

	bool isValid() const;

private:
	void initTourCost();

	void initFromGraph(const lemon::FullDigraph& g, const lemon::FullDigraph::ArcMap<bool>& used, city_id anchor);

	const TSPInstance *inst = nullptr;
	//Die Reihenfolge der Städte auf der gespeicherten Tour
	std::vector<city_id> order;
	//Die Kosten der Tour
	cost_t cost = 0;
};

#endif
