/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef ADS7828_HPP
#define ADS7828_HPP

#include <Arduino.h>
#include <Wire.h>
#include <RtosLock.hpp>
#include <Config.hpp>

// 8-channel 12-bit I2C ADC, single-ended, internal reference off.
class Ads7828 {
public:
    static constexpr uint8_t CHANNELS = 8;

    Ads7828(TwoWire& wire, RtosLock& busLock, uint8_t addr = ADS7828_I2C_ADDR);

    // Probe the address. false when nothing acknowledges.
    bool begin();

    bool readChannel(uint8_t channel, uint16_t& code);

    // All eight channels; false on the first bus error (out is then partial).
    bool readAllChannels(uint16_t out[CHANNELS]);

    uint8_t lastError() const { return _lastError; }

private:
    static uint8_t commandByte_(uint8_t channel);
    bool readChannelLocked_(uint8_t channel, uint16_t& code);

    TwoWire&  _wire;
    RtosLock& _busLock;
    uint8_t   _addr;
    uint8_t   _lastError = 0;
};

#endif // ADS7828_HPP
