#include "bladerfdriver.hh"
#include "streamconfig.hh"
#include "exception.hh"
#include "logger.hh"

using namespace brf;


static inline bladerf_channel
toBladeRFChannel(Channel ch) {
  switch (ch) {
  case CHANNEL_RX0: return BLADERF_CHANNEL_RX(0);
  case CHANNEL_RX1: return BLADERF_CHANNEL_RX(1);
  case CHANNEL_TX0: return BLADERF_CHANNEL_TX(0);
  case CHANNEL_TX1: return BLADERF_CHANNEL_TX(1);
  }
  return BLADERF_CHANNEL_INVALID;
}

// The XB-200 is controlled per module, i.e. the first channel of a direction.
static inline bladerf_channel
toBladeRFModule(Direction dir) {
  return (DIRECTION_RX == dir) ? BLADERF_CHANNEL_RX(0) : BLADERF_CHANNEL_TX(0);
}


/* ********************************************************************************************* *
 * BladeRFDriver
 * ********************************************************************************************* */
BladeRFDriver::BladeRFDriver(struct bladerf *device)
  : Driver(), _device(device)
{
  // pass...
}

BladeRFDriver::~BladeRFDriver() {
  bladerf_close(_device);
}

BladeRFDriver *
BladeRFDriver::open(const std::string &identifier) {
  struct bladerf *device = 0;
  int res = bladerf_open(&device, identifier.empty() ? 0 : identifier.c_str());
  if (0 != res) {
    ConfigError err(res);
    err << "Can not open bladeRF device '" << identifier << "': " << bladerf_strerror(res);
    throw err;
  }

  LogMessage msg(LOG_DEBUG);
  msg << "Opened bladeRF device '" << identifier << "': " << bladerf_get_board_name(device);
  Logger::get().log(msg);

  return new BladeRFDriver(device);
}

std::string
BladeRFDriver::boardName() {
  return bladerf_get_board_name(_device);
}

std::string
BladeRFDriver::statusString(int status) {
  return bladerf_strerror(status);
}

int
BladeRFDriver::configureStream(Direction dir, size_t num_channels, SampleFormat format,
                               const StreamConfig &config)
{
  bladerf_channel_layout layout;
  if (DIRECTION_RX == dir) {
    layout = (2 == num_channels) ? BLADERF_RX_X2 : BLADERF_RX_X1;
  } else {
    layout = (2 == num_channels) ? BLADERF_TX_X2 : BLADERF_TX_X1;
  }

  bladerf_format fmt;
  switch (format) {
  case FORMAT_SC16_Q11: fmt = BLADERF_FORMAT_SC16_Q11; break;
  case FORMAT_SC8_Q7: fmt = BLADERF_FORMAT_SC8_Q7; break;
  default: return BLADERF_ERR_INVAL;
  }

  return bladerf_sync_config(_device, layout, fmt, config.numBuffers(), config.bufferSize(),
                             config.numTransfers(), config.timeout());
}

int
BladeRFDriver::syncRX(void *samples, size_t num_samples, unsigned int timeout_ms) {
  return bladerf_sync_rx(_device, samples, num_samples, 0, timeout_ms);
}

int
BladeRFDriver::syncTX(const void *samples, size_t num_samples, unsigned int timeout_ms) {
  return bladerf_sync_tx(_device, samples, num_samples, 0, timeout_ms);
}

int
BladeRFDriver::enableModule(Channel ch, bool enable) {
  return bladerf_enable_module(_device, toBladeRFChannel(ch), enable);
}

int
BladeRFDriver::gpioRead(uint32_t &value) {
  return bladerf_expansion_gpio_read(_device, &value);
}

int
BladeRFDriver::gpioMaskedWrite(uint32_t mask, uint32_t value) {
  return bladerf_expansion_gpio_masked_write(_device, mask, value);
}

int
BladeRFDriver::gpioDirRead(uint32_t &outputs) {
  return bladerf_expansion_gpio_dir_read(_device, &outputs);
}

int
BladeRFDriver::gpioDirMaskedWrite(uint32_t mask, uint32_t outputs) {
  return bladerf_expansion_gpio_dir_masked_write(_device, mask, outputs);
}

int
BladeRFDriver::expansionAttach(ExpansionBoard board) {
  bladerf_xb xb;
  switch (board) {
  case XB_NONE: xb = BLADERF_XB_NONE; break;
  case XB_100: xb = BLADERF_XB_100; break;
  case XB_200: xb = BLADERF_XB_200; break;
  case XB_300: xb = BLADERF_XB_300; break;
  default: return BLADERF_ERR_INVAL;
  }
  return bladerf_expansion_attach(_device, xb);
}

int
BladeRFDriver::xb200SetFilterbank(Direction dir, Xb200Filter filter) {
  return bladerf_xb200_set_filterbank(_device, toBladeRFModule(dir), bladerf_xb200_filter(filter));
}

int
BladeRFDriver::xb200GetFilterbank(Direction dir, Xb200Filter &filter) {
  bladerf_xb200_filter value;
  int res = bladerf_xb200_get_filterbank(_device, toBladeRFModule(dir), &value);
  if (0 == res) { filter = Xb200Filter(value); }
  return res;
}

int
BladeRFDriver::xb200SetPath(Direction dir, Xb200Path path) {
  return bladerf_xb200_set_path(_device, toBladeRFModule(dir), bladerf_xb200_path(path));
}

int
BladeRFDriver::xb200GetPath(Direction dir, Xb200Path &path) {
  bladerf_xb200_path value;
  int res = bladerf_xb200_get_path(_device, toBladeRFModule(dir), &value);
  if (0 == res) { path = Xb200Path(value); }
  return res;
}
