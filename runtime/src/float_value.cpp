// Float value wrapper split by responsibility.
// Keep include order stable: these fragments form one translation unit.

#include "float_value_parts/01_construction.cpp"
#include "float_value_parts/02_assignment.cpp"
#include "float_value_parts/03_conversion.cpp"
#include "float_value_parts/04_comparison.cpp"
