#pragma once
#include "Polynomials/Calculus.hpp"
#include "Polynomials/Convert.hpp"
#include "Polynomials/Evaluate.hpp"
#include "Polynomials/Homogeneity.hpp"
#include "Polynomials/Poly.hpp"
#include "Polynomials/PolySystem.hpp"
#include "Polynomials/Weyl.hpp"
