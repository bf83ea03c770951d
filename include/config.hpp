#pragma once
#include <cstddef>
#include <cstdint>
#include <iostream> // logs
#include <syncstream>

namespace cfg
{
    // Stdout/stderr sincronizados para logs
    #define SOUT  std::osyncstream(std::cout)
    #define SERR  std::osyncstream(std::cerr)

    // --- Máquina ---
    inline constexpr std::size_t kNumRegs  = 32; // $0..$31 ($0 cableado a cero)
    inline constexpr std::size_t kWordBytes = 4; // palabra de 32 bits

    // Dirección convencional de carga de programas (segmento .text)
    inline constexpr std::uint32_t kDefaultBasePc = 0x00400000;

    // --- Presupuestos de ejecución ---
    inline constexpr std::size_t kRunShortSteps    = 10;
    inline constexpr std::size_t kRunLongSteps     = 100;
    inline constexpr std::size_t kRunUntilEndSteps = 10000; // "hasta el final" sigue siendo acotado

    // Entradas recientes de la traza que muestra un front-end
    inline constexpr std::size_t kTraceTail = 20;

    // --- Flags de log rápidos ---
    inline constexpr bool kLogSim   = false; // carga/reset/corridas de la sesión
    inline constexpr bool kLogCpu   = false; // una línea por instrucción ejecutada
    inline constexpr bool kLogParse = false; // líneas descartadas por el parser

    // Macro simple de logging condicional
    #define LOG_IF(flag, msg)        \
        do {                         \
            if (flag) {              \
                SERR << msg << '\n'; \
            }                        \
        } while (0)
} // namespace cfg
