#include "domain/value_objects/Quantity.hpp"

namespace qm::domain {

template class Quantity<LengthUnit>;
template class Quantity<WeightUnit>;
template class Quantity<VolumeUnit>;
template class Quantity<TemperatureUnit>;

} // namespace qm::domain
