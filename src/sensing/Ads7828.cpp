#include <Ads7828.hpp>

namespace {
// Single-ended channel select (C2 C1 C0 in bits 6..4, odd channels on C2).
const uint8_t kChannelSelect[Ads7828::CHANNELS] = {
    0x00, 0x40, 0x10, 0x50, 0x20, 0x60, 0x30, 0x70
};

constexpr uint8_t kSingleEnded = 0x80;
constexpr uint8_t kAdcOn       = 0x04;   // PD0: converter on, reference off
constexpr uint8_t kErrNoData   = 0xFE;
}

Ads7828::Ads7828(TwoWire& wire, RtosLock& busLock, uint8_t addr)
    : _wire(wire), _busLock(busLock), _addr(addr)
{
}

bool Ads7828::begin() {
    if (!_busLock.lock()) return false;
    _wire.beginTransmission(_addr);
    _lastError = _wire.endTransmission();
    _busLock.unlock();
    return _lastError == 0;
}

uint8_t Ads7828::commandByte_(uint8_t channel) {
    return kSingleEnded | kChannelSelect[channel & 0x07] | kAdcOn;
}

bool Ads7828::readChannelLocked_(uint8_t channel, uint16_t& code) {
    _wire.beginTransmission(_addr);
    _wire.write(commandByte_(channel));
    _lastError = _wire.endTransmission();
    if (_lastError != 0) {
        return false;
    }

    const uint8_t got = _wire.requestFrom(_addr, (uint8_t)2);
    if (got < 2) {
        while (_wire.available()) (void)_wire.read();
        _lastError = kErrNoData;
        return false;
    }

    const uint8_t msb = _wire.read();
    const uint8_t lsb = _wire.read();
    code = (uint16_t)(((msb & 0x0F) << 8) | lsb);
    return true;
}

bool Ads7828::readChannel(uint8_t channel, uint16_t& code) {
    if (channel >= CHANNELS) return false;
    if (!_busLock.lock()) return false;
    const bool ok = readChannelLocked_(channel, code);
    _busLock.unlock();
    return ok;
}

bool Ads7828::readAllChannels(uint16_t out[CHANNELS]) {
    for (uint8_t ch = 0; ch < CHANNELS; ++ch) {
        if (!readChannel(ch, out[ch])) {
            return false;
        }
    }
    return true;
}
