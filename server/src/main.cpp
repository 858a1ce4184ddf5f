/*
 * 설명: 서버 진입점으로 환경설정을 로드해 실행한다.
 * 버전: v1.0.0
 * 테스트: server/tests/e2e/auth_flow_test.cpp
 */
#include <exception>
#include <iostream>

#include <boost/asio/signal_set.hpp>

#include "jts/app.hpp"

int main() {
  using namespace jts;
  AppConfig config = LoadConfigFromEnv();
  try {
    ServerApp app(config);

    boost::asio::signal_set signals(app.GetContext(), SIGINT, SIGTERM);
    signals.async_wait([&app](const boost::system::error_code& ec, int) {
      if (!ec) {
        std::cout << "종료 신호 수신, 서버를 정리합니다\n";
        app.GetContext().stop();
      }
    });

    app.Run();
  } catch (const std::exception& ex) {
    std::cerr << "서버 초기화 실패: " << ex.what() << "\n";
    return 1;
  }
  return 0;
}
