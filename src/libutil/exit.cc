#include "ocs/util/exit.hh"

namespace ocs {

Exit::~Exit() {}

} // namespace ocs
