#include "random.hpp"
#include "padlock/error.hpp"

namespace padlock::crypto {

int UniformSampler::sample_byte() {
    return static_cast<int>(source_.next_byte());
}

int UniformSampler::random_int(int range) {
    if (range > constants::MAX_SAMPLE_RANGE) {
        throw PadlockException(ErrorCode::OutOfRange,
            "Range cannot be more than " + std::to_string(constants::MAX_SAMPLE_RANGE));
    }
    if (range <= 0) {
        throw PadlockException(ErrorCode::InvalidArgument,
            "Range must be positive, got " + std::to_string(range));
    }

    const int q = constants::BYTE_SPACE / range;
    const int accept_bound = q * range;

    int n;
    do {
        n = sample_byte();
    } while (n >= accept_bound);

    return n % range;
}

} // namespace padlock::crypto
