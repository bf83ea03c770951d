#include "simulator.hpp"
#include "word_parser.hpp"
#include "debug_io.hpp"
#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>

/**
 * Driver no interactivo:
 *   mipsim [--base <pc>] [--steps <n> | --until-end] <archivo>
 *   - El archivo tiene una palabra por línea (0xHEX, 32 bits binarios o hex)
 *   - Imprime listado, traza, registros, memoria no nula y estado final
 */
static void usage(const char* prog) {
  SERR << "uso: " << prog << " [--base <pc>] [--steps <n> | --until-end] <archivo>\n";
}

int main(int argc, char **argv)
{
  std::string filePath;
  mipsim::Addr base = cfg::kDefaultBasePc;
  std::size_t steps = cfg::kRunLongSteps;

  // Parse simple de argumentos: el primer no-flag es el path
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--base" && i + 1 < argc) {
      base = mipsim::WordParser::parse_base_pc(argv[++i]);
    } else if (a == "--steps" && i + 1 < argc) {
      std::string n = argv[++i];
      try {
        if (n.empty() || n.find_first_not_of("0123456789") != std::string::npos)
          throw std::invalid_argument(n);
        steps = std::stoul(n);
      } catch (const std::exception&) {
        SERR << "[Main] --steps inválido: " << n << "\n";
        usage(argv[0]);
        return 2;
      }
    } else if (a == "--until-end") {
      steps = cfg::kRunUntilEndSteps;
    } else if (!a.empty() && a[0] == '-') {
      usage(argv[0]);
      return 2;
    } else {
      filePath = a;
    }
  }

  if (filePath.empty()) {
    usage(argv[0]);
    return 2;
  }

  try {
    mipsim::Simulator sim;
    sim.load_from_file(filePath, base);

    SOUT << "=========== INSTRUCCIONES DECODIFICADAS ===========\n";
    mipsim::dbg::print_listing(std::cout, sim.decoded());

    SOUT << "\n================ TRAZA DE EJECUCIÓN ================\n";
    for (const auto& r : sim.run(steps)) mipsim::dbg::print_step(std::cout, r);

    SOUT << "\n==================== REGISTROS ====================\n";
    const auto snap = sim.snapshot();
    mipsim::dbg::print_regs(std::cout, snap.regs);

    SOUT << "\n============ MEMORIA (palabras no nulas) ============\n";
    mipsim::dbg::print_memory(std::cout, snap.memory);

    SOUT << "\n";
    mipsim::dbg::print_state_line(std::cout, snap);
  } catch (const std::exception& e) {
    SERR << "[Main] error: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
