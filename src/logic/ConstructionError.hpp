#pragma once

#include <stdexcept>
#include <string>

// Fatal failure while bringing up the service: path resolution or watch setup.
class ConstructionError : public std::runtime_error
{
public:
    explicit ConstructionError(const std::string& what) : std::runtime_error(what)
    {}
};
