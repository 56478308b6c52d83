#include <ferry/ferry.hpp>
#include <ferry/log.hpp>
#include <chrono>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <string_view>

using namespace ferry;

int main(int argc, char **argv) {
  int argPos = 1;
  if (argPos < argc && std::string_view(argv[argPos]) == "-v") {
    log::set_level(log::level::debug);
    ++argPos;
  }
  if (argc - argPos < 1 || argc - argPos > 3) {
    std::cerr << "Usage: " << argv[0] << " [-v] <url> [method] [body]\n";
    return EXIT_FAILURE;
  }

  const std::string_view url = argv[argPos];
  http::Method method = http::Method::GET;
  if (argc - argPos > 1) {
    const auto parsed = http::MethodFromStr(argv[argPos + 1]);
    if (!parsed) {
      std::cerr << "Unknown method: " << argv[argPos + 1] << "\n";
      return EXIT_FAILURE;
    }
    method = *parsed;
  }

  try {
    Client client(ClientConfig{}
                      .withConnectTimeout(std::chrono::seconds{10})
                      .withRequestTimeout(std::chrono::seconds{60})
                      .withRetryTimes(1)
                      .withUserAgent("ferry-fetch")
                      .withDecompression(DecompressionConfig{}.withEnable()));

    Request request(method, url);
    if (argc - argPos > 2) {
      request.withBody(RequestBody::FromString(argv[argPos + 2]));
    }

    auto response = client.send(request);
    std::cerr << response.version().str() << ' ' << response.statusCode() << ' ' << response.reason() << '\n';
    for (const auto &header : response.headers()) {
      std::cerr << header.name() << ": " << header.value() << '\n';
    }
    std::cerr << "(final URI: " << response.uri().str() << ")\n\n";

    char buf[8192];
    for (auto nb = response.body().read(buf, sizeof(buf)); nb != 0; nb = response.body().read(buf, sizeof(buf))) {
      std::cout.write(buf, static_cast<std::streamsize>(nb));
    }
    std::cout.flush();
  } catch (const HttpClientError &err) {
    std::cerr << "Request failed (" << ErrorKindToStr(err.kind()) << " during " << ErrorPhaseToStr(err.phase())
              << "): " << err.message() << '\n';
    return EXIT_FAILURE;
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << '\n';
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
