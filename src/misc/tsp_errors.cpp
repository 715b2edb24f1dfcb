#include <tsp_errors.hpp>

std::string toString(MipStatus status) {
	switch (status) {
		case MipStatus::optimal:
			return "OPTIMAL";
		case MipStatus::feasible_suboptimal:
			return "FEASIBLE_SUBOPTIMAL";
		case MipStatus::infeasible:
			return "INFEASIBLE";
		case MipStatus::timed_out_no_solution:
			return "TIMED_OUT_NO_SOLUTION";
	}
	return "UNKNOWN";
}
