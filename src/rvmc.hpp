//!
//! @file rvmc.hpp
//! @brief Wrapper header
//! @authors Lorenzo Fabbri, Francesco Orso Pancaldi
//!
//! Wrapper header for radial-vmc.
//! Is the only header that should be #included when using the library.
//!

#ifndef RVMC_RVMC_HPP
#define RVMC_RVMC_HPP

#include "config.hpp"
#include "export.hpp"
#include "statistics.hpp"
#include "types.hpp"
#include "vmcalgs.hpp"
#include "wavefunction.hpp"

#endif
