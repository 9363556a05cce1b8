#pragma once

#include "apicat/core/catalog.hpp"

#include <string>

namespace apicat_dump {

std::string dump_catalog(const apicat::openapi::catalog& cat);

} // namespace apicat_dump
