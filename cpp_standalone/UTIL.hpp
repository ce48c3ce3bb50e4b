// Shared utility functions for the PLINK fileset reader
// Text tokenizing helpers and wall/CPU timers

#ifndef UTIL_HPP
#define UTIL_HPP

#include <armadillo>
#include <sys/time.h>
#include <string>
#include <vector>

// Split a line on whitespace (spaces and tabs)
std::vector<std::string> splitLine(const std::string& line);

// Remove a trailing \r (Windows line endings)
void removeTrailingCR(std::string& s);

// Time(0) = wall-clock seconds, Time(1) = CPU seconds
arma::vec getTime();

void printTime(arma::vec t1, arma::vec t2, std::string message);

#endif
