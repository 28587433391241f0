// Anchors the vtable and meta-object of the Q_OBJECT interface class.
#include "DeviceSignalSource.hpp"
