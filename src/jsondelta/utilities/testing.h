#ifndef JSONDELTA_UTILITIES_TESTING_H
#define JSONDELTA_UTILITIES_TESTING_H

#include <catch2/catch.hpp>

#include <jsondelta/core/exception.hpp>

#endif
