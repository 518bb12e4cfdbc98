/**
 * Resumable chunked upload client
 *
 * Usage:
 *   chunked_upload_client <server_url> <file> [chunk_size]
 *   chunked_upload_client <server_url> <file> --resume <upload_id>
 *
 * 1. Initialize an upload session (or fetch the status of an existing one)
 * 2. Upload every missing chunk, retrying transient failures
 * 3. Complete the upload and print the server-side SHA-256
 */

#include <algorithm>
#include <chrono>
#include <fstream>
#include <iostream>
#include <set>
#include <sstream>
#include <string>
#include <thread>

#include <Poco/JSON/Array.h>
#include <Poco/JSON/Object.h>
#include <Poco/JSON/Parser.h>
#include <Poco/Net/HTMLForm.h>
#include <Poco/Net/HTTPClientSession.h>
#include <Poco/Net/HTTPRequest.h>
#include <Poco/Net/HTTPResponse.h>
#include <Poco/Net/StringPartSource.h>
#include <Poco/NumberParser.h>
#include <Poco/Path.h>
#include <Poco/StreamCopier.h>
#include <Poco/URI.h>

using namespace Poco::Net;
using namespace Poco::JSON;
using namespace std;

namespace {
constexpr int kMaxAttempts = 3;
}

class ChunkedUploadClient {
private:
    HTTPClientSession session;

    /// Send a request and parse the JSON body; returns the HTTP status.
    int exchange(HTTPRequest& request, const string& body, Object::Ptr& out) {
        request.setContentLength(static_cast<std::streamsize>(body.size()));
        ostream& request_stream = session.sendRequest(request);
        request_stream << body;
        return receive(out);
    }

    int receive(Object::Ptr& out) {
        HTTPResponse response;
        istream& response_stream = session.receiveResponse(response);
        string response_body;
        Poco::StreamCopier::copyToString(response_stream, response_body);
        Parser parser;
        out = parser.parse(response_body).extract<Object::Ptr>();
        return static_cast<int>(response.getStatus());
    }

    static string errorMessage(const Object::Ptr& obj) {
        auto error = obj->getObject("error");
        if (!error) {
            return "unknown error";
        }
        return error->getValue<string>("code") + ": " + error->getValue<string>("message");
    }

public:
    explicit ChunkedUploadClient(const string& url) {
        Poco::URI uri(url);
        session.setHost(uri.getHost());
        session.setPort(uri.getPort());
        session.setKeepAlive(true);
    }

    Object::Ptr init(const string& filename, uint64_t file_size, uint64_t chunk_size) {
        const uint64_t total_chunks = (file_size + chunk_size - 1) / chunk_size;
        Object::Ptr body = new Object;
        body->set("filename", filename);
        body->set("file_size", static_cast<Poco::UInt64>(file_size));
        body->set("chunk_size", static_cast<Poco::UInt64>(chunk_size));
        body->set("total_chunks", static_cast<Poco::UInt64>(total_chunks));
        stringstream json;
        body->stringify(json);

        HTTPRequest request(HTTPRequest::HTTP_POST, "/upload/init", HTTPMessage::HTTP_1_1);
        request.setContentType("application/json");
        Object::Ptr result;
        const int status = exchange(request, json.str(), result);
        if (status != HTTPResponse::HTTP_CREATED) {
            cout << "✗ Init failed: " << errorMessage(result) << endl;
            return nullptr;
        }
        cout << "✓ Upload " << result->getValue<string>("upload_id") << " created ("
             << total_chunks << " chunks)" << endl;
        return result;
    }

    Object::Ptr status(const string& upload_id) {
        HTTPRequest request(HTTPRequest::HTTP_GET, "/upload/" + upload_id + "/status",
                            HTTPMessage::HTTP_1_1);
        Object::Ptr result;
        const int code = exchange(request, "", result);
        if (code != HTTPResponse::HTTP_OK) {
            cout << "✗ Status failed: " << errorMessage(result) << endl;
            return nullptr;
        }
        return result;
    }

    bool uploadChunk(const string& upload_id, int chunk_number, const string& data) {
        for (int attempt = 1; attempt <= kMaxAttempts; ++attempt) {
            try {
                HTMLForm form(HTMLForm::ENCODING_MULTIPART);
                form.set("upload_id", upload_id);
                form.set("chunk_number", to_string(chunk_number));
                form.addPart("chunk",
                             new StringPartSource(data, "application/octet-stream", "chunk"));

                HTTPRequest request(HTTPRequest::HTTP_POST, "/upload/chunk",
                                    HTTPMessage::HTTP_1_1);
                form.prepareSubmit(request);
                form.write(session.sendRequest(request));

                Object::Ptr result;
                const int code = receive(result);
                if (code == HTTPResponse::HTTP_OK) {
                    cout << "  chunk " << chunk_number << " -> "
                         << result->getValue<double>("progress_percent") << "%"
                         << (result->getValue<bool>("duplicate") ? " (duplicate)" : "") << endl;
                    return true;
                }
                cout << "  chunk " << chunk_number << " attempt " << attempt
                     << " failed: " << errorMessage(result) << endl;
                if (code != 429 && code < 500) {
                    return false;
                }
            } catch (const Poco::Exception& e) {
                cout << "  chunk " << chunk_number << " attempt " << attempt
                     << " error: " << e.displayText() << endl;
                session.reset();
            }
            this_thread::sleep_for(chrono::seconds(attempt));
        }
        return false;
    }

    bool complete(const string& upload_id) {
        Object::Ptr body = new Object;
        body->set("upload_id", upload_id);
        stringstream json;
        body->stringify(json);

        HTTPRequest request(HTTPRequest::HTTP_POST, "/upload/complete", HTTPMessage::HTTP_1_1);
        request.setContentType("application/json");
        Object::Ptr result;
        const int code = exchange(request, json.str(), result);
        if (code != HTTPResponse::HTTP_OK) {
            cout << "✗ Complete failed: " << errorMessage(result) << endl;
            return false;
        }
        cout << "✓ Video " << result->getValue<string>("id") << " assembled" << endl;
        cout << "  sha256: " << result->getValue<string>("file_hash") << endl;
        cout << "  throughput: " << result->getValue<Poco::UInt64>("throughput_bps") << " B/s"
             << endl;
        return true;
    }
};

int main(int argc, char** argv) {
    if (argc < 3) {
        cerr << "usage: " << argv[0] << " <server_url> <file> [chunk_size | --resume <id>]"
             << endl;
        return 2;
    }
    const string server_url = argv[1];
    const string path = argv[2];
    uint64_t chunk_size = 1048576;
    string upload_id;
    if (argc >= 5 && string(argv[3]) == "--resume") {
        upload_id = argv[4];
    } else if (argc >= 4 && !Poco::NumberParser::tryParseUnsigned64(argv[3], chunk_size)) {
        cerr << "invalid chunk size: " << argv[3] << endl;
        return 2;
    }

    ifstream file(path, ios::binary | ios::ate);
    if (!file.is_open()) {
        cerr << "✗ Cannot open file: " << path << endl;
        return 1;
    }
    const uint64_t file_size = static_cast<uint64_t>(file.tellg());

    try {
        ChunkedUploadClient client(server_url);
        set<int> missing;
        int total_chunks = 0;
        if (upload_id.empty()) {
            auto created = client.init(Poco::Path(path).getFileName(), file_size, chunk_size);
            if (!created) {
                return 1;
            }
            upload_id = created->getValue<string>("upload_id");
            total_chunks = created->getValue<int>("total_chunks");
            for (int n = 1; n <= total_chunks; ++n) {
                missing.insert(n);
            }
        } else {
            auto current = client.status(upload_id);
            if (!current) {
                return 1;
            }
            chunk_size = current->getValue<Poco::UInt64>("chunk_size");
            total_chunks = current->getValue<int>("total_chunks");
            auto list = current->getArray("missing_chunk_list");
            for (size_t i = 0; list && i < list->size(); ++i) {
                missing.insert(list->getElement<int>(static_cast<unsigned int>(i)));
            }
            cout << "✓ Resuming " << upload_id << ": " << missing.size() << " of "
                 << total_chunks << " chunks missing" << endl;
        }

        string buffer;
        for (int chunk_number : missing) {
            const uint64_t offset = static_cast<uint64_t>(chunk_number - 1) * chunk_size;
            const uint64_t length = min<uint64_t>(chunk_size, file_size - offset);
            buffer.resize(static_cast<size_t>(length));
            file.clear();
            file.seekg(static_cast<streamoff>(offset));
            file.read(&buffer[0], static_cast<streamsize>(length));
            if (!client.uploadChunk(upload_id, chunk_number, buffer)) {
                cout << "✗ Giving up; resume later with --resume " << upload_id << endl;
                return 1;
            }
        }
        return client.complete(upload_id) ? 0 : 1;
    } catch (const Poco::Exception& e) {
        cerr << "✗ " << e.displayText() << endl;
        return 1;
    }
}
