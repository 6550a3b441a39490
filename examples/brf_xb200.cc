#include "brf.hh"

#include <iostream>

using namespace brf;


static Options::Definition options[] = {
  {"device", 'd', Options::ANY,
   "Specifies the libbladeRF device identifier. By default, the first device found is used."},
  {"filter", 'f', Options::ANY,
   "Selects the RX and TX filter bank, one of 50M, 144M, 222M, custom, auto1db or auto3db."},
  {"mix", 'm', Options::FLAG, "Routes the signal through the XB-200 mixer (default bypass)."},
  {"write", 'w', Options::INTEGER, "Drives header pin J16-1 low (0) or high (1)."},
  {"read", 'r', Options::FLAG, "Reads header pin J16-2."},
  {"verbose", 'v', Options::FLAG, "Shows debug messages."},
  {"help", 'h', Options::FLAG, "Prints this help."},
  {0, 0, Options::FLAG, 0}
};

static void print_help() {
  std::cerr << "USAGE: brf_xb200 [OPTIONS]" << std::endl << std::endl;
  Options::print_help(std::cerr, options);
}

static bool parse_filter(const std::string &name, Xb200Filter &filter) {
  if ("50M" == name) { filter = XB200_50M; }
  else if ("144M" == name) { filter = XB200_144M; }
  else if ("222M" == name) { filter = XB200_222M; }
  else if ("custom" == name) { filter = XB200_CUSTOM; }
  else if ("auto1db" == name) { filter = XB200_AUTO_1DB; }
  else if ("auto3db" == name) { filter = XB200_AUTO_3DB; }
  else { return false; }
  return true;
}


int main(int argc, char *argv[]) {
  Options opts;
  if (! Options::parse(options, argc, argv, opts)) {
    print_help(); return -1;
  }
  if (opts.has("help")) {
    print_help(); return 0;
  }

  Logger::get().addHandler(
        new StreamLogHandler(std::cerr, opts.has("verbose") ? LOG_DEBUG : LOG_INFO));

  Xb200Filter filter = XB200_AUTO_1DB;
  if (opts.has("filter") && (! parse_filter(opts.get("filter").toString(), filter))) {
    std::cerr << "Unknown filter bank '" << opts.get("filter").toString() << "'." << std::endl;
    print_help(); return -1;
  }

  try {
    BladeRF1 device(BladeRFDriver::open(opts.get("device", std::string())));
    Xb200 xb200(device);

    Xb200Path path = opts.has("mix") ? XB200_MIX : XB200_BYPASS;
    xb200.setFilterbank(DIRECTION_RX, filter);
    xb200.setFilterbank(DIRECTION_TX, filter);
    xb200.setPath(DIRECTION_RX, path);
    xb200.setPath(DIRECTION_TX, path);
    std::cerr << "XB-200 filter bank RX " << xb200.filterbank(DIRECTION_RX)
              << ", TX " << xb200.filterbank(DIRECTION_TX) << "; "
              << ((XB200_MIX == xb200.path(DIRECTION_RX)) ? "mixer" : "bypass") << "."
              << std::endl;

    Xb200Pins pins = xb200.takePins();
    if (opts.has("write")) {
      OutputPin out = std::move(pins.j16_1).asOutput();
      out.write(opts.get("write", 0L) ? PIN_HIGH : PIN_LOW);
      std::cerr << "J16-1 is " << (opts.get("write", 0L) ? "high" : "low") << "." << std::endl;
    }
    if (opts.has("read")) {
      InputPin in = std::move(pins.j16_2).asInput();
      std::cout << (in.isHigh() ? 1 : 0) << std::endl;
    }
  } catch (Error &err) {
    std::cerr << "Error: " << err.what() << std::endl;
    return -1;
  }

  return 0;
}
