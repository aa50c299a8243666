#include <Mlx90614.hpp>
#include <SensorConversions.hpp>

namespace {
constexpr uint8_t  kErrNoData    = 0xFE;
constexpr uint8_t  kErrFlagged   = 0xFD;
constexpr uint16_t kRamErrorFlag = 0x8000;  // set by the sensor on a bad read
}

Mlx90614::Mlx90614(TwoWire& wire, RtosLock& busLock, uint8_t addr)
    : _wire(wire), _busLock(busLock), _addr(addr)
{
}

bool Mlx90614::begin() {
    uint16_t raw = 0;
    return readWord(REG_TOBJ1, raw);
}

bool Mlx90614::readWord(uint8_t reg, uint16_t& value) {
    if (!_busLock.lock()) return false;

    _wire.beginTransmission(_addr);
    _wire.write(reg);
    _lastError = _wire.endTransmission(false);   // repeated start
    if (_lastError != 0) {
        _busLock.unlock();
        return false;
    }

    // LSB, MSB, PEC
    const uint8_t got = _wire.requestFrom(_addr, (uint8_t)3);
    if (got < 2) {
        while (_wire.available()) (void)_wire.read();
        _lastError = kErrNoData;
        _busLock.unlock();
        return false;
    }
    const uint8_t lsb = _wire.read();
    const uint8_t msb = _wire.read();
    while (_wire.available()) (void)_wire.read();
    _busLock.unlock();

    value = (uint16_t)((msb << 8) | lsb);
    return true;
}

bool Mlx90614::readObjectTemperature(float& tempC) {
    uint16_t raw = 0;
    if (!readWord(REG_TOBJ1, raw)) {
        return false;
    }
    if (raw & kRamErrorFlag) {
        _lastError = kErrFlagged;
        return false;
    }

    const float t = SensorConv::irRawToC(raw);
    if (!isfinite(t)) {
        return false;
    }
    tempC = t;
    return true;
}
