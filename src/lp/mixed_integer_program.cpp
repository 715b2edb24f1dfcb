#include <mixed_integer_program.hpp>
#include <cmath>
#include <ilcplex/cplex.h>
#include <ilcplex/cpxconst.h>
#include <lemon/tolerance.h>
#include <cstddef>
#include <iostream>
#include <string>
#include <vector>

variable_id MixedIntegerProgram::invalid_variable = -1;

MixedIntegerProgram::MixedIntegerProgram(const SharedCplexEnv& env, const std::string& name, Goal opt) : env(env) {
	int status;
	problem = CPXcreateprob(env.get(), &status, name.c_str());
	if (status != 0) {
		throw std::runtime_error("Could not create CPLEX problem: " + getErrorMessage(status, env.get()));
	}
	int result = CPXchgobjsen(env.get(), problem, opt);
	if (result != 0) {
		CPXfreeprob(env.get(), &problem);
		throw std::runtime_error("Could not set objective sense: " + getErrorMessage(result, env.get()));
	}
}

MixedIntegerProgram::~MixedIntegerProgram() {
	CPXfreeprob(env.get(), &problem);
}

/**
 * Fügt neue Variablen desselben Typs zum MIP hinzu
 * @param objCoeff Die Koeffizienten der Variablen in der Zielfunktion
 * @param lower Untere Schranken für die Variablen
 * @param upper Obere Schranken für die variablen
 * @param type binär oder kontinuierlich
 */
void MixedIntegerProgram::addVariables(const std::vector<double>& objCoeff, const std::vector<double>& lower,
									   const std::vector<double>& upper, VariableType type) {
	if (objCoeff.size() != lower.size() || objCoeff.size() != upper.size()) {
		throw std::runtime_error("Variable data has inconsistent sizes");
	}
	std::vector<char> types(objCoeff.size(), static_cast<char>(type));
	check(CPXnewcols(env.get(), problem, static_cast<int>(objCoeff.size()), objCoeff.data(), lower.data(),
					 upper.data(), types.data(), nullptr),
		  "add variables to MIP");
	varCount += static_cast<variable_id>(objCoeff.size());
}

/**
 * Fügt die angegebene Constraint zum MIP hinzu
 */
void MixedIntegerProgram::addConstraint(const Constraint& constr) {
	std::vector<Constraint> temp{constr};
	addConstraints(temp.begin(), temp.end());
}

/**
 * Fügt eine native Indikator-Bedingung hinzu: Hat die binäre Variable constr.indicator den Wert 1, so muss
 * constr.implied erfüllt sein.
 */
void MixedIntegerProgram::addIndicatorConstraint(const IndicatorConstraint& constr) {
	const Constraint& lin = constr.implied;
	if (!lin.isValid()) {
		throw std::runtime_error("Tried to add an indicator constraint without nonzeroes");
	}
	check(CPXaddindconstr(env.get(), problem, constr.indicator, 0, static_cast<int>(lin.getNonzeroes().size()),
						  lin.getRHS(), lin.getSense(), lin.getNonzeroes().data(), lin.getCoeffs().data(), nullptr),
		  "add indicator constraint to MIP");
	++indicatorCount;
}

/**
 * Gibt CPLEX eine (ggf. partielle) Startlösung vor. Nicht angegebene Variablen werden von CPLEX ergänzt.
 * @param vars Die Variablen, deren Startwert gesetzt wird
 * @param values Die Startwerte, values[i] gehört zu vars[i]
 */
void MixedIntegerProgram::addMipStart(const std::vector<variable_id>& vars, const std::vector<double>& values,
									  const std::string& name) {
	if (vars.size() != values.size()) {
		throw std::runtime_error("MIP start has " + std::to_string(vars.size()) + " variables, but " +
								 std::to_string(values.size()) + " values");
	}
	int begin = 0;
	int effort = CPX_MIPSTART_AUTO;
	std::vector<char> nameBuffer(name.begin(), name.end());
	nameBuffer.push_back('\0');
	char *names[] = {nameBuffer.data()};
	check(CPXaddmipstarts(env.get(), problem, 1, static_cast<int>(vars.size()), &begin, vars.data(), values.data(),
						  &effort, names),
		  "add MIP start");
}

void MixedIntegerProgram::applyParameters(const Parameters& params) {
	params.check();
	//Die Parameter gehören zur Umgebung und werden daher vor jedem Lösen vollständig neu gesetzt
	check(CPXsetdblparam(env.get(), CPXPARAM_TimeLimit, params.timeLimit), "set time limit");
	check(CPXsetdblparam(env.get(), CPXPARAM_MIP_Tolerances_MIPGap, params.relativeGap), "set relative MIP gap");
	check(CPXsetintparam(env.get(), CPXPARAM_Threads, params.threads), "set thread count");
	check(CPXsetintparam(env.get(), CPXPARAM_Parallel, CPX_PARALLEL_DETERMINISTIC), "set parallel mode");
	check(CPXsetintparam(env.get(), CPXPARAM_ScreenOutput, params.verbose ? CPX_ON : CPX_OFF),
		  "set screen output");
}

/**
 * Löst das MIP mit den angegebenen Abbruchkriterien. Eine gefundene Lösung wird zusammen mit dem Status
 * zurückgegeben. Unzulässigkeit und das Erreichen eines Limits ohne Lösung werden über den Status gemeldet, alle
 * anderen Abbrüche (z.B. Unbeschränktheit) führen zu einem Fehler.
 */
MixedIntegerProgram::Solution MixedIntegerProgram::solve(const Parameters& params) {
	applyParameters(params);
	check(CPXmipopt(env.get(), problem), "solve MIP");
	int status = CPXgetstat(env.get(), problem);
	int method, type, primalFeasible, dualFeasible;
	check(CPXsolninfo(env.get(), problem, &method, &type, &primalFeasible, &dualFeasible),
		  "query solution info");
	Solution out;
	switch (status) {
		case CPXMIP_OPTIMAL:
			out.status = MipStatus::optimal;
			break;
		case CPXMIP_INFEASIBLE:
		case CPXMIP_INForUNBD:
			out.status = MipStatus::infeasible;
			return out;
		case CPXMIP_UNBOUNDED:
			throw std::runtime_error("MIP is unbounded");
		case CPXMIP_TIME_LIM_INFEAS:
		case CPXMIP_DETTIME_LIM_INFEAS:
		case CPXMIP_NODE_LIM_INFEAS:
		case CPXMIP_MEM_LIM_INFEAS:
		case CPXMIP_ABORT_INFEAS:
			out.status = MipStatus::timed_out_no_solution;
			return out;
		default:
			//CPXMIP_OPTIMAL_TOL und alle Limits, bei denen eine Lösung existiert
			if (type == CPX_NO_SOLN) {
				throw std::runtime_error("MIP solver stopped without a solution, status was " +
										 std::to_string(status));
			}
			out.status = MipStatus::feasible_suboptimal;
			break;
	}
	out.vector.resize(static_cast<size_t>(varCount));
	check(CPXgetobjval(env.get(), problem, &out.value), "get objective value");
	check(CPXgetx(env.get(), problem, out.vector.data(), 0, varCount - 1), "get MIP solution");
	check(CPXgetmiprelgap(env.get(), problem, &out.gap), "get relative MIP gap");
	return out;
}

variable_id MixedIntegerProgram::getVariableCount() const {
	return varCount;
}

int MixedIntegerProgram::getConstraintCount() const {
	return constraintCount;
}

int MixedIntegerProgram::getIndicatorCount() const {
	return indicatorCount;
}

SharedCplexEnv MixedIntegerProgram::openCPLEX() {
	int status;
	SharedCplexEnv ret(CPXopenCPLEX(&status), [](CPXENVptr env) {
		CPXcloseCPLEX(&env);
	});
	if (status != 0) {
		throw std::runtime_error("Failed to open CPLEX environment: " +
								 MixedIntegerProgram::getErrorMessage(status, nullptr));
	}
	return ret;
}

std::string MixedIntegerProgram::getErrorMessage(int error, CPXCENVptr env) {
	char buffer[CPXMESSAGEBUFSIZE];
	if (CPXgeterrorstring(env, error, buffer) != nullptr) {
		return buffer;
	}
	return "Unknown error: " + std::to_string(error);
}

void MixedIntegerProgram::check(int result, const std::string& action) const {
	if (result != 0) {
		throw std::runtime_error("Could not " + action + ", return value was " + getErrorMessage(result, env.get()));
	}
}

void MixedIntegerProgram::Parameters::check() const {
	if (!std::isfinite(timeLimit) || timeLimit <= 0) {
		throw InputError("Time limit must be positive, got " + std::to_string(timeLimit));
	}
	if (!(relativeGap >= 0 && relativeGap < 1)) {
		throw InputError("Relative MIP gap must be in [0, 1), got " + std::to_string(relativeGap));
	}
	if (threads < 0) {
		throw InputError("Thread count must not be negative, got " + std::to_string(threads));
	}
}

double MixedIntegerProgram::Solution::operator[](size_t index) const {
	return vector[index];
}

double MixedIntegerProgram::Solution::getValue() const {
	return value;
}

double MixedIntegerProgram::Solution::getRelativeGap() const {
	return gap;
}

MipStatus MixedIntegerProgram::Solution::getStatus() const {
	return status;
}

bool MixedIntegerProgram::Solution::hasValues() const {
	return status == MipStatus::optimal || status == MipStatus::feasible_suboptimal;
}

const std::vector<double>& MixedIntegerProgram::Solution::getVector() const {
	return vector;
}

MixedIntegerProgram::Constraint::Constraint(const std::vector<int>& indices, const std::vector<double>& coeffs,
											MixedIntegerProgram::CompType cmp, double rhs) :
		indices(indices), coeffs(coeffs), comp(cmp), rhs(rhs) {
	if (indices.size() != coeffs.size()) {
		throw std::runtime_error("Constraint has " + std::to_string(indices.size()) + " nonzeroes, but " +
								 std::to_string(coeffs.size()) + " coefficients");
	}
}

const std::vector<int>& MixedIntegerProgram::Constraint::getNonzeroes() const {
	return indices;
}

const std::vector<double>& MixedIntegerProgram::Constraint::getCoeffs() const {
	return coeffs;
}

MixedIntegerProgram::CompType MixedIntegerProgram::Constraint::getSense() const {
	return comp;
}

double MixedIntegerProgram::Constraint::getRHS() const {
	return rhs;
}

bool MixedIntegerProgram::Constraint::isValidLHS(double lhs, lemon::Tolerance<double> tolerance) const {
	switch (comp) {
		case less_eq:
			return !tolerance.less(rhs, lhs);
		case equal:
			return !tolerance.different(lhs, rhs);
		case greater_eq:
			return !tolerance.less(lhs, rhs);
	}
	return false;
}

double MixedIntegerProgram::Constraint::evalLHS(const std::vector<double>& variables) const {
	double ret = 0;
	for (size_t i = 0; i < indices.size(); ++i) {
		ret += variables[indices[i]] * coeffs[i];
	}
	return ret;
}

bool MixedIntegerProgram::Constraint::isValid() const {
	return !indices.empty();
}

bool MixedIntegerProgram::Constraint::isViolated(const std::vector<double>& vars,
												 lemon::Tolerance<double> tolerance) const {
	return !isValidLHS(evalLHS(vars), tolerance);
}

/**
 * Die Bedingung gilt als verletzt, wenn der Indikator (gerundet) 1 ist und die lineare Bedingung nicht erfüllt ist
 */
bool MixedIntegerProgram::IndicatorConstraint::isViolated(const std::vector<double>& vars,
														  lemon::Tolerance<double> tolerance) const {
	return vars[indicator] > 0.5 && implied.isViolated(vars, tolerance);
}
