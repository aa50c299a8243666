/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef MLX90614_HPP
#define MLX90614_HPP

#include <Arduino.h>
#include <Wire.h>
#include <RtosLock.hpp>
#include <Config.hpp>

// MLX90614 IR thermometer over SMBus (no PEC check).
class Mlx90614 {
public:
    static constexpr uint8_t REG_TOBJ1 = 0x07;

    Mlx90614(TwoWire& wire, RtosLock& busLock, uint8_t addr = MLX90614_I2C_ADDR);

    bool begin();

    // Object temperature in Celsius, clamped to the sensor range.
    bool readObjectTemperature(float& tempC);

    bool readWord(uint8_t reg, uint16_t& value);

    uint8_t lastError() const { return _lastError; }

private:
    TwoWire&  _wire;
    RtosLock& _busLock;
    uint8_t   _addr;
    uint8_t   _lastError = 0;
};

#endif // MLX90614_HPP
