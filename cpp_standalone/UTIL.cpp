// Shared utility functions for the PLINK fileset reader

#include "UTIL.hpp"

#include <ctime>
#include <iostream>
#include <sstream>

// ============================================================
// splitLine: split a line on whitespace
// ============================================================
std::vector<std::string> splitLine(const std::string& line) {
    std::vector<std::string> tokens;
    std::istringstream iss(line);
    std::string token;
    while (iss >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

// ============================================================
// removeTrailingCR: strip \r left by Windows line endings
// ============================================================
void removeTrailingCR(std::string& s) {
    if (!s.empty() && s.back() == '\r') {
        s.pop_back();
    }
}

arma::vec getTime() {
    arma::vec Time(2, arma::fill::zeros);
    struct timeval time;
    if (!gettimeofday(&time, NULL)) {
        Time(0) = (double)time.tv_sec + (double)time.tv_usec * .000001;
    }
    Time(1) = (double)clock() / CLOCKS_PER_SEC;
    return Time;
}

void printTime(arma::vec t1, arma::vec t2, std::string message) {
    double wallTime = t2(0) - t1(0);
    double cpuTime = t2(1) - t1(1);
    if (wallTime < 60) {
        std::cout << "Complete " << message << " in " << wallTime
                  << " seconds (wall), " << cpuTime << " seconds (CPU)." << std::endl;
    } else {
        std::cout << "Complete " << message << " in " << wallTime / 60
                  << " minutes (wall), " << cpuTime / 60 << " minutes (CPU)." << std::endl;
    }
}
