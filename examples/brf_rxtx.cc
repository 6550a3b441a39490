#include "brf.hh"

#include <iostream>
#include <csignal>
#include <cmath>
#include <pthread.h>

using namespace brf;

typedef std::complex<int16_t> CI16;
typedef SharedRxSyncStream<CI16, BladeRFAny> RxStream;
typedef SharedTxSyncStream<CI16, BladeRFAny> TxStream;

static volatile sig_atomic_t __running = 1;

static void __sigint_handler(int signo) {
  // On SIGINT -> let both threads finish their current transfer
  __running = 0;
}

/** Shared state of the receiver thread. */
typedef struct {
  RxStream *stream;
  size_t    bufferSize;
  long      count;
  unsigned  timeout;
  size_t    received;
  double    power;
  bool      failed;
} RxContext;

/** Shared state of the transmitter thread. */
typedef struct {
  TxStream *stream;
  size_t    bufferSize;
  long      count;
  unsigned  timeout;
  double    frequency;
  size_t    transmitted;
  bool      failed;
} TxContext;


static void *
rx_main(void *arg) {
  RxContext *ctx = reinterpret_cast<RxContext *>(arg);
  std::vector<CI16> buffer(ctx->bufferSize);
  const float scale = FormatTraits<CI16>::scale;
  try {
    ctx->stream->enable();
    for (long i=0; (__running && ((ctx->count < 0) || (i < ctx->count))); i++) {
      ctx->stream->read(buffer, ctx->timeout);
      double power = 0;
      for (size_t j=0; j<buffer.size(); j++) {
        double re = buffer[j].real()/scale, im = buffer[j].imag()/scale;
        power += re*re + im*im;
      }
      ctx->power = power/buffer.size();
      ctx->received += buffer.size();
    }
    ctx->stream->disable();
  } catch (Error &err) {
    LogMessage msg(LOG_ERROR);
    msg << "RX: " << err.what();
    Logger::get().log(msg);
    ctx->failed = true;
  }
  return 0;
}


static void *
tx_main(void *arg) {
  TxContext *ctx = reinterpret_cast<TxContext *>(arg);
  std::vector<CI16> buffer(ctx->bufferSize);
  // A tone at half scale, the buffer holds an integer number of periods if possible
  const float scale = 0.5*FormatTraits<CI16>::scale;
  for (size_t j=0; j<buffer.size(); j++) {
    double phi = 2*M_PI*ctx->frequency*j;
    buffer[j] = CI16(int16_t(scale*std::cos(phi)), int16_t(scale*std::sin(phi)));
  }
  try {
    ctx->stream->enable();
    for (long i=0; (__running && ((ctx->count < 0) || (i < ctx->count))); i++) {
      ctx->stream->write(buffer, ctx->timeout);
      ctx->transmitted += buffer.size();
    }
    ctx->stream->disable();
  } catch (Error &err) {
    LogMessage msg(LOG_ERROR);
    msg << "TX: " << err.what();
    Logger::get().log(msg);
    ctx->failed = true;
  }
  return 0;
}


static Options::Definition options[] = {
  {"device", 'd', Options::ANY,
   "Specifies the libbladeRF device identifier, e.g. '*:serial=f12ce1'. By default, the first "
   "device found is used."},
  {"buffer-size", 'b', Options::INTEGER,
   "Specifies the number of samples transferred at once (default 8192)."},
  {"count", 'c', Options::INTEGER,
   "Specifies the number of buffers to transfer per direction. By default, the transfer runs "
   "until interrupted by CTRL-C."},
  {"timeout", 't', Options::INTEGER,
   "Specifies the timeout of each transfer in ms (default 1000)."},
  {"tone", 'f', Options::FLOAT,
   "Specifies the frequency of the transmitted tone relative to the sample rate (default 0.01)."},
  {"rx-only", 'r', Options::FLAG, "Receive only."},
  {"verbose", 'v', Options::FLAG, "Shows debug messages."},
  {"help", 'h', Options::FLAG, "Prints this help."},
  {0, 0, Options::FLAG, 0}
};

static void print_help() {
  std::cerr << "USAGE: brf_rxtx [OPTIONS]" << std::endl << std::endl;
  Options::print_help(std::cerr, options);
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

  size_t buffer_size = size_t(opts.get("buffer-size", 8192L));
  long count = opts.get("count", -1L);
  unsigned timeout = unsigned(opts.get("timeout", 1000L));
  double tone = opts.has("tone") ? opts.get("tone").toFloat() : 0.01;

  // Register handler:
  signal(SIGINT, __sigint_handler);

  try {
    std::shared_ptr<BladeRFAny> device(
          new BladeRFAny(BladeRFDriver::open(opts.get("device", std::string()))));
    std::cerr << "Using " << device->boardName() << "." << std::endl;

    StreamConfig config(16, buffer_size, 8, timeout);
    RxStream rx = RxStream::configure(device, config);
    RxContext rx_ctx = { &rx, buffer_size, count, timeout, 0, 0, false };
    pthread_t rx_thread;

    if (opts.has("rx-only")) {
      if (0 != pthread_create(&rx_thread, 0, rx_main, &rx_ctx)) {
        std::cerr << "Can not start receiver thread." << std::endl; return -1;
      }
      pthread_join(rx_thread, 0);
    } else {
      // both streams exist before any thread runs
      TxStream tx = TxStream::configure(device, config);
      TxContext tx_ctx = { &tx, buffer_size, count, timeout, tone, 0, false };
      pthread_t tx_thread;
      if (0 != pthread_create(&rx_thread, 0, rx_main, &rx_ctx)) {
        std::cerr << "Can not start receiver thread." << std::endl; return -1;
      }
      if (0 != pthread_create(&tx_thread, 0, tx_main, &tx_ctx)) {
        std::cerr << "Can not start transmitter thread." << std::endl;
        __running = 0; pthread_join(rx_thread, 0);
        return -1;
      }
      pthread_join(tx_thread, 0);
      pthread_join(rx_thread, 0);
      std::cerr << "Transmitted " << tx_ctx.transmitted << " samples." << std::endl;
      if (tx_ctx.failed) { return -1; }
    }

    std::cerr << "Received " << rx_ctx.received << " samples, last mean power "
              << 10*std::log10(rx_ctx.power) << " dBFS." << std::endl;
    if (rx_ctx.failed) { return -1; }
  } catch (Error &err) {
    std::cerr << "Error: " << err.what() << std::endl;
    return -1;
  }

  return 0;
}
