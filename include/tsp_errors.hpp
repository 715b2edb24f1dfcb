#ifndef TSP_ERRORS_HPP
#define TSP_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using city_id = int;

/**
 * Ungültige Eingabe (zu wenige Städte, Index außerhalb von [0, n), fehlerhafte Koordinaten oder Parameter). Wird
 * geworfen, bevor ein Modell erstellt wird.
 */
class InputError : public std::invalid_argument {
public:
	explicit InputError(const std::string& what) : std::invalid_argument(what) {}
};

enum class MipStatus {
	optimal,
	feasible_suboptimal,
	infeasible,
	timed_out_no_solution
};

std::string toString(MipStatus status);

/**
 * Der MIP-Solver hat ein Modell für unzulässig erklärt, das bei vollständiger Kantenmenge immer zulässig sein muss.
 * Deutet auf einen Fehler beim Aufbau der Nebenbedingungen hin.
 */
class ModelInconsistencyError : public std::runtime_error {
public:
	ModelInconsistencyError(const std::string& what, MipStatus status)
			: std::runtime_error(what), status(status) {}

	MipStatus getStatus() const {
		return status;
	}

private:
	MipStatus status;
};

/**
 * Die vom Solver gelieferte Kantenbelegung ist keine einzelne Tour durch alle Städte. Enthält neben der Teiltour
 * den Status und Zielfunktionswert des Solvers, damit der Aufrufer z.B. mit anderen Parametern neu lösen kann.
 */
class ExtractionValidationError : public std::runtime_error {
public:
	ExtractionValidationError(const std::string& what, std::vector<city_id> partialTour, double objective,
							  MipStatus status)
			: std::runtime_error(what), partialTour(std::move(partialTour)), objective(objective), status(status) {}

	//Die Städte, die vor dem Fehler vom Anker aus erreicht wurden
	const std::vector<city_id>& getPartialTour() const {
		return partialTour;
	}

	//Der vom Solver gemeldete Zielfunktionswert
	double getObjective() const {
		return objective;
	}

	MipStatus getStatus() const {
		return status;
	}

private:
	std::vector<city_id> partialTour;
	double objective;
	MipStatus status;
};

#endif
