// File: src/fields/field.cpp
#include "fields/field.hpp"
#include <sstream>

namespace canforge {

std::string Field::ToString() const {
    std::ostringstream oss;
    oss << "Field(start_bit=" << start_bit
        << ", length=" << length
        << ", type=" << canforge::ToString(type)
        << ", category=" << canforge::ToString(category)
        << ", n_values=" << n_values << ")";
    return oss.str();
}

} // namespace canforge
