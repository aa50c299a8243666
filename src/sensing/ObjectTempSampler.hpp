/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef OBJECT_TEMP_SAMPLER_HPP
#define OBJECT_TEMP_SAMPLER_HPP

#include <Utils.hpp>
#include <Mlx90614.hpp>

// Workpiece temperature from the MLX90614, 100 ms.
class ObjectTempSampler {
public:
    ObjectTempSampler(Mlx90614& ir, float smoothAlpha);

    bool begin();

private:
    static void _taskThunk(void* arg);
    void _taskLoop();

    Mlx90614&    _ir;
    float        _alpha;
    TaskHandle_t _taskHandle = nullptr;
    uint32_t     _errorCount = 0;
};

#endif // OBJECT_TEMP_SAMPLER_HPP
