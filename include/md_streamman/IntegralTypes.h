#ifndef MDSM_INTEGRAL_TYPES_H
#define MDSM_INTEGRAL_TYPES_H

#include <cstdint>

namespace md_streamman {
	using UTinyInt = uint8_t;
	using TinyInt = int8_t;
	using UInt = uint32_t;
	using Int = int32_t;
	using UBigInt = uint64_t;

	// position of an element in Begin order, starting at 1
	using ElementSerial = UBigInt;
}

#endif
