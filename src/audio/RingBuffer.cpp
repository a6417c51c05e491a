/**
 * RingBuffer.cpp - Lock-free SPSC implementation
 * Note: Most logic is in header (template class)
 */

#include "parley/audio/RingBuffer.hpp"

namespace parley::audio {

// PCM16 is the only sample type crossing the PortAudio boundary
template class RingBuffer<int16_t>;

} // namespace parley::audio
