#include <Cask/Containers/MapError.hpp>

namespace Cask::Containers
{
    const char* ToString(MapErrc code) noexcept
    {
        switch (code)
        {
            case MapErrc::Ok: return "ok";
            case MapErrc::InvalidCapacity: return "initial capacity must be a positive integer no larger than the maximum table size";
            case MapErrc::InvalidLoadFactor: return "load factor must be a positive finite number";
            case MapErrc::Reentrancy: return "callback re-entered a bucket it already holds";
        }
        return "unknown map error";
    }
}// namespace Cask::Containers
