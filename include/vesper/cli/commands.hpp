#pragma once

namespace vesper::cli {

[[nodiscard]] int run_cli(int argc, char **argv);

} // namespace vesper::cli
