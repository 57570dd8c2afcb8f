#include <cassert>
#include <string>

#include "url_codec.h"

using namespace clipsync::common;

int main() {
  {
    assert(UrlEncode("a b&c=d") == "a%20b%26c%3Dd");
    assert(UrlDecode("%41%4a%zz%") == "AJ%zz%");
    assert(UrlDecode("my+laptop") == "my laptop");
    QueryParams params = {{"apiKey", "k&y"}, {"hostname", "host name"}};
    assert(ParseQuery(EncodeQuery(params)) == params);
  }

  {
    const QueryParams query = ParseQuery("apiKey=s%20ecret&hostname=my+laptop&flag");
    assert(QueryValue(query, "apiKey") == "s ecret");
    assert(QueryValue(query, "hostname") == "my laptop");
    assert(QueryValue(query, "flag").empty());
    assert(QueryValue(query, "missing").empty());
  }

  {
    WsUrl url;
    std::string err;
    assert(ParseWsUrl("ws://example.com:9000/ws?x=1", url, err));
    assert(url.host == "example.com");
    assert(url.port == 9000);
    assert(url.path == "/ws");
    assert(url.query.size() == 1 && url.query[0].second == "1");

    assert(ParseWsUrl("WS://localhost", url, err));
    assert(url.port == 80);
    assert(url.path == "/");
    assert(HostHeader(url) == "localhost");
    assert(RequestTarget(url) == "/");

    assert(ParseWsUrl("ws://[::1]:8080/ws", url, err));
    assert(url.host == "::1");
    assert(url.port == 8080);
    assert(HostHeader(url) == "[::1]:8080");

    assert(!ParseWsUrl("wss://secure.example.com/ws", url, err));
    assert(err == "server url must start with ws://");
    assert(!ParseWsUrl("http://example.com", url, err));
    assert(!ParseWsUrl("ws://host:0/ws", url, err));
    assert(err == "server url has invalid port");
    assert(!ParseWsUrl("ws://host:99999/ws", url, err));
    assert(!ParseWsUrl("ws://:8080/ws", url, err));
    assert(err == "server url has no host");
    assert(!ParseWsUrl("ws://[::1/ws", url, err));
  }

  {
    // Existing query parameters survive; apiKey and hostname are overwritten.
    WsUrl url;
    std::string err;
    assert(ParseWsUrl("ws://127.0.0.1:8080/ws?apiKey=old&room=7", url, err));
    SetQueryValue(url.query, "apiKey", "new key");
    SetQueryValue(url.query, "hostname", "desk");
    assert(url.query.size() == 3);
    assert(RequestTarget(url) == "/ws?apiKey=new%20key&room=7&hostname=desk");
    assert(HostHeader(url) == "127.0.0.1:8080");
  }

  return 0;
}
