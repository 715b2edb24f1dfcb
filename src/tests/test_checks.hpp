#ifndef TEST_CHECKS_HPP
#define TEST_CHECKS_HPP

#include <algorithm>
#include <cmath>
#include <exception>
#include <iostream>
#include <string>
#include <utility>

/**
 * Sammelt die Ergebnisse der Prüfungen eines Testprogramms. Fehlschläge werden auf std::cerr ausgegeben, der
 * Rückgabewert von exitCode() ist 0 genau dann, wenn alle Prüfungen erfolgreich waren.
 */
class TestChecks {
public:
	explicit TestChecks(std::string name) : name(std::move(name)) {}

	bool check(bool ok, const std::string& what) {
		if (ok) {
			++passed;
		} else {
			++failed;
			std::cerr << name << ": FAILED " << what << std::endl;
		}
		return ok;
	}

	bool checkNear(double actual, double expected, const std::string& what, double eps = 1e-6) {
		return check(std::abs(actual - expected) <= eps * std::max(1.0, std::abs(expected)),
					 what + " (got " + std::to_string(actual) + ", expected " + std::to_string(expected) + ")");
	}

	/**
	 * Prüft, dass f eine Exception vom Typ E wirft
	 */
	template<typename E, typename F>
	bool checkThrows(F f, const std::string& what) {
		try {
			f();
		} catch (const E&) {
			return check(true, what);
		} catch (const std::exception& other) {
			return check(false, what + " threw the wrong exception: " + other.what());
		}
		return check(false, what + " did not throw");
	}

	int exitCode() const {
		std::cout << name << ": " << passed << " checks passed, " << failed << " failed" << std::endl;
		return failed == 0 ? 0 : 1;
	}

private:
	std::string name;
	int passed = 0;
	int failed = 0;
};

#endif
