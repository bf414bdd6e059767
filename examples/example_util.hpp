#pragma once

#include <iostream>
#include <emlxx/detail/result.hpp>

inline void print_error(const emlxx::error& err, std::ostream& os = std::cerr)
{
    os << "Error: " << err.to_string() << "\n";
    if (!err.detail().empty())
        os << "Detail: " << err.detail() << "\n";
}
