#include "ferry/request-encoder.hpp"

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <iterator>
#include <span>
#include <string_view>

#include "ferry/http-constants.hpp"
#include "ferry/http-method.hpp"
#include "ferry/request.hpp"

namespace ferry {

TargetForm SelectTargetForm(http::Method method, bool plainProxy) noexcept {
  if (method == http::Method::CONNECT) {
    return TargetForm::Authority;
  }
  return plainProxy ? TargetForm::Absolute : TargetForm::Origin;
}

RequestEncoder::RequestEncoder(const Request &request, TargetForm targetForm) : _request(request) {
  const Uri &uri = request.uri();
  _requestLine.append(http::MethodToStr(request.method()));
  _requestLine.push_back(' ');
  switch (targetForm) {
    case TargetForm::Absolute:
      _requestLine.append(uri.absoluteForm());
      break;
    case TargetForm::Authority:
      _requestLine.append(uri.hostAndPort());
      break;
    default:
      _requestLine.append(uri.originForm());
      break;
  }
  _requestLine.push_back(' ');
  _requestLine.append(request.version().str());
  _requestLine.append(http::CRLF);
}

std::string_view RequestEncoder::currentPiece() const noexcept {
  switch (_step) {
    case Step::RequestLine:
      return _requestLine;
    case Step::HeaderLine:
      return std::next(_request.headers().begin(), static_cast<std::ptrdiff_t>(_headerPos))->raw();
    case Step::HeaderCRLF:
      [[fallthrough]];
    case Step::FinalCRLF:
      return http::CRLF;
    default:
      return {};
  }
}

void RequestEncoder::nextPiece() noexcept {
  _pieceOffset = 0;
  switch (_step) {
    case Step::RequestLine:
      _step = _request.headers().empty() ? Step::FinalCRLF : Step::HeaderLine;
      break;
    case Step::HeaderLine:
      _step = Step::HeaderCRLF;
      break;
    case Step::HeaderCRLF:
      ++_headerPos;
      _step = _headerPos < _request.headers().size() ? Step::HeaderLine : Step::FinalCRLF;
      break;
    default:
      _step = Step::Done;
      break;
  }
}

std::size_t RequestEncoder::encode(std::span<char> out) {
  std::size_t written = 0;
  while (_step != Step::Done && written < out.size()) {
    const std::string_view piece = currentPiece().substr(_pieceOffset);
    const std::size_t nbBytes = std::min(piece.size(), out.size() - written);
    std::memcpy(out.data() + written, piece.data(), nbBytes);
    written += nbBytes;
    _pieceOffset += nbBytes;
    if (nbBytes == piece.size()) {
      nextPiece();
    }
  }
  return written;
}

}  // namespace ferry
