/**
 * @file ServoController.cpp
 * @brief Single-pin PWM servo output implementation
 *
 * @license MIT
 */

#include "ServoController.hpp"
#include <pigpiod_if2.h>
#include <iostream>
#include <algorithm>


//=============================================================================
// CONSTRUCTOR / DESTRUCTOR
//=============================================================================

ServoController::ServoController(int pin_num, int pi_handle,
                                 int min_pw, int max_pw, int home_pw, bool inverted)
    : pi(pi_handle),
      pin(pin_num),
      min_pw(min_pw),
      max_pw(max_pw),
      home_pw(std::clamp(home_pw, min_pw, max_pw)),
      inverted(inverted),
      current_pw(this->home_pw),
      released(false)
{
    if (set_servo_pulsewidth(pi, pin, toPhysical(this->home_pw)) != 0) {
        std::cerr << "[Pigpio] GPIO " << pin << " rejected initial pulse width" << std::endl;
    }
}


ServoController::~ServoController() {
    // An emergency-stopped servo must not move again on shutdown
    if (released) {
        return;
    }
    // Return to rest before the daemon handle goes away.
    // NOTE: pigpio_stop() is PigpioDriver's job, the handle is shared.
    if (set_servo_pulsewidth(pi, pin, toPhysical(home_pw)) != 0) {
        std::cerr << "[Pigpio] GPIO " << pin << " could not return home" << std::endl;
    }
}


//=============================================================================
// CONTROL INTERFACE
//=============================================================================

bool ServoController::setPulseWidth(int microseconds) {
    int clamped_pw = clampPulseWidth(microseconds);

    int rc = set_servo_pulsewidth(pi, pin, toPhysical(clamped_pw));
    if (rc != 0) {
        std::cerr << "[Pigpio] GPIO " << pin << " write failed (" << rc << ")" << std::endl;
        return false;
    }

    current_pw = clamped_pw;
    released = false;
    return true;
}


bool ServoController::home() {
    return setPulseWidth(home_pw);
}


bool ServoController::release() {
    // A pulse width of 0 switches servo pulses off on this pin
    int rc = set_servo_pulsewidth(pi, pin, 0);
    if (rc != 0) {
        std::cerr << "[Pigpio] GPIO " << pin << " release failed (" << rc << ")" << std::endl;
        return false;
    }
    released = true;
    return true;
}


bool ServoController::configure(int min_pw, int max_pw, int home_pw, bool inverted) {
    this->min_pw = min_pw;
    this->max_pw = max_pw;
    this->home_pw = std::clamp(home_pw, min_pw, max_pw);
    this->inverted = inverted;

    if (released) {
        current_pw = clampPulseWidth(current_pw);
        return true;
    }
    return setPulseWidth(current_pw);
}


//=============================================================================
// HELPER FUNCTIONS
//=============================================================================

int ServoController::clampPulseWidth(int pw) const {
    return std::clamp(pw, min_pw, max_pw);
}


int ServoController::toPhysical(int pw) const {
    // Mirror around the range center:
    //   min_pw -> max_pw, max_pw -> min_pw, center -> center
    return inverted ? (min_pw + max_pw - pw) : pw;
}
