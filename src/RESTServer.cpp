#include "RESTServer.hpp"
#include "AnnotationRenderer.hpp"
#include "Base64.hpp"
#include "FaceAIError.hpp"
#include "FaceJson.hpp"
#include "FaceRegion.hpp"
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio.hpp>
#include <nlohmann/json.hpp>
#include <opencv2/imgcodecs.hpp>
#include <cstdint>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;
using json = nlohmann::json;

namespace faceAI {

namespace {

// Base64 photographs are well above Beast's 1 MiB default
constexpr std::uint64_t kMaxBodyBytes = 32 * 1024 * 1024;

cv::Mat decodeRequestImage(const json& body) {
    if (!body.contains("image") || !body["image"].is_string()) {
        throw std::invalid_argument("Base64 image not provided");
    }

    std::vector<unsigned char> imageData = base64Decode(body["image"].get<std::string>());
    if (imageData.empty()) {
        throw std::invalid_argument("Failed to decode base64 image");
    }

    cv::Mat image = cv::imdecode(imageData, cv::IMREAD_COLOR);
    if (image.empty()) {
        throw std::invalid_argument("Failed to decode image data");
    }
    return image;
}

json modelToJson(const std::string& role, const InferenceModel& model) {
    json info;
    info["id"] = role;
    info["name"] = model.name();
    info["status"] = "loaded";
    info["type"] = "attribute_classification";
    info["input_size"] = model.inputElementCount();
    if (auto onnx = dynamic_cast<const ONNXInferenceEngine*>(&model)) {
        info["input_shape"] = onnx->inputShape();
        info["output_shape"] = onnx->outputShape();
        info["provider"] = onnx->usingCUDA() ? "cuda" : "cpu";
    }
    return info;
}

} // namespace

class RESTServer::Impl {
public:
    Impl(const std::string& host, int port,
         std::shared_ptr<const FaceAttributePipeline> pipeline,
         std::shared_ptr<FaceDetector> detector,
         std::shared_ptr<const ModelContext> models)
        : host_(host), port_(port), ioc_(), acceptor_(ioc_),
          pipeline_(std::move(pipeline)), detector_(std::move(detector)), models_(std::move(models)) {
        if (!pipeline_ || !detector_ || !models_) {
            throw std::invalid_argument("RESTServer requires a pipeline, a detector and models");
        }
    }

    void start() {
        try {
            auto const address = net::ip::make_address(host_);
            tcp::endpoint endpoint{address, static_cast<unsigned short>(port_)};

            acceptor_.open(endpoint.protocol());
            acceptor_.set_option(net::socket_base::reuse_address(true));
            acceptor_.bind(endpoint);
            acceptor_.listen(net::socket_base::max_listen_connections);

            std::cout << "Starting server on http://" << host_ << ":" << port_ << std::endl;
            std::cout << "Available endpoints:" << std::endl;
            std::cout << "  GET/HEAD /health" << std::endl;
            std::cout << "  GET /module_health" << std::endl;
            std::cout << "  POST /analyze      {\"image\": \"<base64>\", \"faces\": [optional boxes]}" << std::endl;
            std::cout << "  POST /annotate     {\"image\": \"<base64>\", \"faces\": [optional boxes]}" << std::endl;
            std::cout << "  POST /detect_faces {\"image\": \"<base64>\"}" << std::endl;

            accept();
            ioc_.run();
        }
        catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << std::endl;
        }
    }

    void stop() {
        ioc_.stop();
    }

private:
    void accept() {
        acceptor_.async_accept(
            [this](beast::error_code ec, tcp::socket socket) {
                if (!ec) {
                    std::make_shared<Session>(std::move(socket), *this)->start();
                }
                accept();
            });
    }

    class Session : public std::enable_shared_from_this<Session> {
    public:
        Session(tcp::socket socket, Impl& server) : socket_(std::move(socket)), server_(server) {
            parser_.body_limit(kMaxBodyBytes);
        }

        void start() {
            read_request();
        }

    private:
        void read_request() {
            auto self = shared_from_this();

            http::async_read(
                socket_,
                buffer_,
                parser_,
                [self](beast::error_code ec, std::size_t) {
                    if (!ec) {
                        self->request_ = self->parser_.release();
                        self->process_request();
                    } else if (ec != http::error::end_of_stream) {
                        std::cerr << "Error reading request: " << ec.message() << std::endl;
                    }
                });
        }

        void process_request() {
            response_.version(request_.version());
            response_.keep_alive(false);

            // Handle health endpoint for both HEAD and GET methods
            if (request_.target() == "/health") {
                response_.result(http::status::ok);
                response_.set(http::field::content_type, "application/json");
                if (request_.method() == http::verb::get) {
                    response_.body() = "{\"status\":\"ok\",\"service\":\"faceAI\"}";
                }
            }
            else if (request_.target() == "/module_health" && request_.method() == http::verb::get) {
                handle_module_health();
            }
            else if (request_.method() == http::verb::post) {
                handle_post();
            }
            else {
                set_error(http::status::bad_request, "Invalid request method");
            }

            write_response();
        }

        void handle_module_health() {
            json response_json;
            response_json["status"] = "ok";
            response_json["service"] = "faceAI";

            json models = json::array();
            models.push_back(modelToJson("gender", *server_.models_->gender()));
            models.push_back(modelToJson("age", *server_.models_->age()));
            models.push_back(modelToJson("emotion", *server_.models_->emotion()));

            json face_model;
            face_model["id"] = server_.detector_->name();
            face_model["status"] = server_.detector_->isLoaded() ? "loaded" : "not_loaded";
            face_model["type"] = "face_detection";
            models.push_back(face_model);

            response_json["models"] = models;
            set_json(response_json);
        }

        void handle_post() {
            const auto target = request_.target();
            if (target != "/analyze" && target != "/annotate" && target != "/detect_faces") {
                set_error(http::status::not_found, "Endpoint not found");
                return;
            }

            try {
                auto req_body = json::parse(request_.body());
                cv::Mat image = decodeRequestImage(req_body);

                if (target == "/analyze") {
                    handle_analyze(req_body, image);
                } else if (target == "/annotate") {
                    handle_annotate(req_body, image);
                } else {
                    handle_detect_faces(image);
                }
            }
            catch (const json::exception& e) {
                std::cerr << "Malformed request body: " << e.what() << std::endl;
                set_error(http::status::bad_request, e.what());
            }
            catch (const std::invalid_argument& e) {
                std::cerr << "Invalid request: " << e.what() << std::endl;
                set_error(http::status::bad_request, e.what());
            }
            catch (const DetectionUnavailable& e) {
                std::cerr << e.what() << std::endl;
                set_error(http::status::service_unavailable, e.what());
            }
            catch (const std::exception& e) {
                std::cerr << "Error processing request: " << e.what() << std::endl;
                set_error(http::status::internal_server_error, e.what());
            }
        }

        void handle_analyze(const json& req_body, const cv::Mat& image) {
            const FaceAttributePipeline& pipeline = *server_.pipeline_;

            std::optional<std::vector<FaceAttributes>> faces;
            if (auto boxes = parseFaces(req_body)) {
                faces = pipeline.analyzeFaces(image, *boxes);
            } else {
                faces = pipeline.analyze(image, *server_.detector_);
            }

            if (!faces) {
                set_error(http::status::service_unavailable, "No result: face detection unavailable");
                return;
            }

            json response_json;
            response_json["faces"] = json::array();
            for (const auto& face : *faces) {
                response_json["faces"].push_back(faceToJson(face));
            }
            if (faces->empty()) {
                response_json["message"] = kNoFaceMessage;
            }
            set_json(response_json);
        }

        void handle_annotate(const json& req_body, const cv::Mat& image) {
            std::vector<BoundingBox> boxes;
            if (auto supplied = parseFaces(req_body)) {
                boxes = *supplied;
            } else {
                boxes = server_.pipeline_->detectFaces(image, *server_.detector_);
            }
            for (const auto& box : boxes) {
                validateBox(image.size(), box);
            }

            cv::Mat annotated = annotateFaces(image, boxes);

            std::vector<unsigned char> png;
            if (!cv::imencode(".png", annotated, png)) {
                throw std::runtime_error("Failed to encode annotated image");
            }

            json response_json;
            response_json["face_count"] = boxes.size();
            response_json["image"] = base64Encode(png);
            set_json(response_json);
        }

        void handle_detect_faces(const cv::Mat& image) {
            auto boxes = server_.pipeline_->detectFaces(image, *server_.detector_);

            json response_json = json::array();
            for (size_t i = 0; i < boxes.size(); i++) {
                json detection;
                detection["index"] = i + 1;
                detection["bbox"] = boxToJson(boxes[i]);
                response_json.push_back(detection);
            }
            set_json(response_json);
        }

        void set_json(const json& body) {
            response_.result(http::status::ok);
            response_.set(http::field::content_type, "application/json");
            response_.body() = body.dump();
        }

        void set_error(http::status status, const std::string& message) {
            response_.result(status);
            response_.set(http::field::content_type, "text/plain");
            response_.body() = "Error: " + message;
        }

        void write_response() {
            auto self = shared_from_this();

            response_.set(http::field::server, BOOST_BEAST_VERSION_STRING);
            response_.prepare_payload();

            http::async_write(
                socket_,
                response_,
                [self](beast::error_code ec, std::size_t) {
                    self->socket_.shutdown(tcp::socket::shutdown_send, ec);
                });
        }

        tcp::socket socket_;
        Impl& server_;
        beast::flat_buffer buffer_;
        http::request_parser<http::string_body> parser_;
        http::request<http::string_body> request_;
        http::response<http::string_body> response_;
    };

    std::string host_;
    int port_;
    net::io_context ioc_;
    tcp::acceptor acceptor_;

    std::shared_ptr<const FaceAttributePipeline> pipeline_;
    std::shared_ptr<FaceDetector> detector_;
    std::shared_ptr<const ModelContext> models_;
};

RESTServer::RESTServer(const std::string& host, int port,
                       std::shared_ptr<const FaceAttributePipeline> pipeline,
                       std::shared_ptr<FaceDetector> detector,
                       std::shared_ptr<const ModelContext> models)
    : pImpl_(std::make_unique<Impl>(host, port, std::move(pipeline), std::move(detector), std::move(models))) {}

RESTServer::~RESTServer() = default;

void RESTServer::start() {
    pImpl_->start();
}

void RESTServer::stop() {
    pImpl_->stop();
}

} // namespace faceAI
