#pragma once

// -----------------------------------------------------------------------------
// Telemetry level configuration
// -----------------------------------------------------------------------------

#if defined(RTMPWIRE_ENABLE_TELEMETRY_L1)
    #define RW_TL1(expr) expr
#else
    #define RW_TL1(expr) ((void)0)
#endif
