#ifndef MIXED_INTEGER_PROGRAM_HPP
#define MIXED_INTEGER_PROGRAM_HPP

#include <vector>
#include <string>
#include <ilcplex/cplex.h>
#include <lemon/tolerance.h>
#include <stdexcept>
#include <memory>
#include <type_traits>
#include <iterator>
#include <tsp_errors.hpp>

using variable_id = int;

using SharedCplexEnv = std::shared_ptr<std::remove_pointer<CPXENVptr>::type>;

/**
 * Ein gemischt-ganzzahliges lineares Programm, das von CPLEX gelöst wird. Jede Instanz besitzt genau ein
 * CPLEX-Problem, das im Destruktor freigegeben wird.
 */
class MixedIntegerProgram {
public:
	enum CompType {
		less_eq = 'L',
		equal = 'E',
		greater_eq = 'G'
	};
	enum Goal {
		minimize = CPX_MIN,
		maximize = CPX_MAX
	};
	enum VariableType {
		binary = CPX_BINARY,
		continuous = CPX_CONTINUOUS
	};

	/**
	 * Abbruchkriterien und sonstige Einstellungen für einen Aufruf von solve
	 */
	struct Parameters {
		//Maximale Laufzeit in Sekunden
		double timeLimit = 60;
		//Relative Lücke zwischen bester Lösung und bester Schranke, ab der abgebrochen wird
		double relativeGap = 1e-4;
		//0: CPLEX entscheidet
		int threads = 0;
		bool verbose = false;

		void check() const;
	};

	class Solution {
	public:
		Solution() = default;

		double operator[](size_t index) const;

		double getValue() const;

		double getRelativeGap() const;

		MipStatus getStatus() const;

		bool hasValues() const;

		const std::vector<double>& getVector() const;

	private:
		friend MixedIntegerProgram;
		std::vector<double> vector;
		double value = 0;
		double gap = 0;
		MipStatus status = MipStatus::timed_out_no_solution;
	};

	class Constraint {
	public:
		Constraint(const std::vector<int>& indices, const std::vector<double>& coeffs, CompType cmp, double rhs);

		const std::vector<int>& getNonzeroes() const;

		const std::vector<double>& getCoeffs() const;

		CompType getSense() const;

		double getRHS() const;

		bool isValidLHS(double lhs, lemon::Tolerance<double> tolerance) const;

		double evalLHS(const std::vector<double>& variables) const;

		bool isValid() const;

		bool isViolated(const std::vector<double>& vars, lemon::Tolerance<double> tolerance) const;

	private:
		std::vector<int> indices;
		std::vector<double> coeffs;
		CompType comp;
		double rhs;
	};

	/**
	 * Die lineare Bedingung muss nur erfüllt sein, wenn die binäre Variable indicator den Wert 1 hat
	 */
	struct IndicatorConstraint {
		variable_id indicator;
		Constraint implied;

		bool isViolated(const std::vector<double>& vars, lemon::Tolerance<double> tolerance) const;
	};

	MixedIntegerProgram(const SharedCplexEnv& env, const std::string& name, Goal opt);

	MixedIntegerProgram(const MixedIntegerProgram& other) = delete;

	MixedIntegerProgram& operator=(const MixedIntegerProgram& other) = delete;

	~MixedIntegerProgram();

	void addVariables(const std::vector<double>& objCoeff, const std::vector<double>& lower,
					  const std::vector<double>& upper, VariableType type);

	void addConstraint(const Constraint& constr);

	template<typename It>
	void addConstraints(const It& begin, const It& end);

	void addIndicatorConstraint(const IndicatorConstraint& constr);

	void addMipStart(const std::vector<variable_id>& vars, const std::vector<double>& values,
					 const std::string& name);

	Solution solve(const Parameters& params);

	variable_id getVariableCount() const;

	int getConstraintCount() const;

	int getIndicatorCount() const;

	static variable_id invalid_variable;

	static SharedCplexEnv openCPLEX();

private:
	static std::string getErrorMessage(int error, CPXCENVptr env);

	void check(int result, const std::string& action) const;

	void applyParameters(const Parameters& params);

	SharedCplexEnv env;
	CPXLPptr problem;
	variable_id varCount = 0;
	int constraintCount = 0;
	int indicatorCount = 0;
};

template<typename It>
void MixedIntegerProgram::addConstraints(const It& begin, const It& end) {
	std::vector<double> rhs;
	std::vector<double> coeffs;
	std::vector<int> indices;
	std::vector<int> constrStarts;
	std::vector<char> sense;
	auto addCount = static_cast<int>(std::distance(begin, end));
	constrStarts.reserve(addCount);
	sense.reserve(addCount);
	rhs.reserve(addCount);
	for (It i = begin; i != end; ++i) {
		const Constraint& c = *i;
		if (!c.isValid()) {
			throw std::runtime_error("Tried to add a constraint without nonzeroes");
		}
		constrStarts.push_back(static_cast<int>(indices.size()));
		rhs.push_back(c.getRHS());
		sense.push_back(static_cast<char>(c.getSense()));
		indices.insert(indices.end(), c.getNonzeroes().begin(), c.getNonzeroes().end());
		coeffs.insert(coeffs.end(), c.getCoeffs().begin(), c.getCoeffs().end());
	}
	check(CPXaddrows(env.get(), problem, 0, addCount, static_cast<int>(indices.size()), rhs.data(),
					 sense.data(), constrStarts.data(), indices.data(), coeffs.data(), nullptr, nullptr),
		  "add constraints to MIP");
	constraintCount += addCount;
}

#endif
