#pragma once

#include "driver/gpio.h"

// Board input pin assignment.
// Knob push button (BOOT)
#define BSP_BTN_PRESS GPIO_NUM_0
// Encoder phases
#define BSP_ENCODER_A GPIO_NUM_6
#define BSP_ENCODER_B GPIO_NUM_5
