#include "http_channel.hpp"
#include "../prompts.hpp"
#include "../utils.hpp"
#include <iostream>

namespace webscout {

static const char* WEB_CHAT_HTML = R"HTML(<!DOCTYPE html>
<html lang="en">
<head>
<meta charset="UTF-8">
<meta name="viewport" content="width=device-width, initial-scale=1.0">
<title>webscout</title>
<style>
*{margin:0;padding:0;box-sizing:border-box}
:root{--bg:#0a0e17;--surface:#111827;--surface2:#1a2235;--border:#1e2d4a;--cyan:#00e5ff;--text:#e0e6ed;--dim:#6b7a90;--user-bg:#0d2137;--warn:#ffb300;--err:#ff4757}
body{font-family:system-ui,-apple-system,sans-serif;background:var(--bg);color:var(--text);height:100vh;display:flex;flex-direction:column;overflow:hidden}
#header{background:var(--surface);border-bottom:1px solid var(--border);padding:12px 20px;display:flex;align-items:center;gap:12px}
#header h1{font-size:16px;font-weight:600;color:var(--cyan)}
#prompts{display:flex;gap:8px;margin-left:auto;flex-wrap:wrap}
#prompts button{background:var(--surface2);color:var(--text);border:1px solid var(--border);border-radius:6px;padding:4px 10px;font-size:12px;cursor:pointer}
#status{width:8px;height:8px;border-radius:50%;background:#39ff14}
#status.wait{background:var(--warn)}
#status.err{background:var(--err)}
#msgs{flex:1;overflow-y:auto;padding:16px;display:flex;flex-direction:column;gap:6px}
.msg{padding:10px 16px;border-radius:8px;max-width:85%;line-height:1.6;font-size:14px;white-space:pre-wrap;word-break:break-word}
.msg.user{background:var(--user-bg);border:1px solid #163a5c;align-self:flex-end}
.msg.assistant{background:var(--surface);border:1px solid var(--border);align-self:flex-start}
.msg.tool_activity{color:var(--dim);font-size:12px;align-self:flex-start;cursor:pointer}
.msg.tool_activity pre{display:none;margin-top:6px;font-size:11px;white-space:pre-wrap}
.msg.tool_activity.open pre{display:block}
.msg.file{border:1px solid var(--cyan);align-self:flex-start}
.msg.file a{color:var(--cyan)}
.msg.system{border:1px solid var(--warn);color:var(--warn);align-self:center;font-size:13px}
#input-area{background:var(--surface);border-top:1px solid var(--border);padding:12px 16px;display:flex;gap:10px}
#input{flex:1;background:var(--surface2);border:1px solid var(--border);border-radius:8px;color:var(--text);padding:10px 14px;font-size:14px;font-family:inherit;resize:none;min-height:42px;outline:none}
#send{background:var(--cyan);color:#000;border:none;border-radius:8px;padding:10px 20px;font-weight:600;cursor:pointer}
#send:disabled{opacity:0.4;cursor:not-allowed}
</style>
</head>
<body>
<div id="header"><div id="status"></div><h1>webscout</h1><div id="prompts"></div></div>
<div id="msgs"></div>
<div id="input-area">
  <textarea id="input" rows="1" placeholder="Ask for research or documents..." autofocus></textarea>
  <button id="send">Send</button>
</div>
<script>
const msgs=document.getElementById('msgs'),input=document.getElementById('input'),sendBtn=document.getElementById('send'),status=document.getElementById('status');
let chatId=null,since=0,timer=null;

function esc(t){return String(t).replace(/&/g,'&amp;').replace(/</g,'&lt;').replace(/>/g,'&gt;');}
function md(t){return esc(t).replace(/\*\*([^*]+)\*\*/g,'<strong>$1</strong>').replace(/\[([^\]]+)\]\(([^)]+)\)/g,'<a href="$2" target="_blank">$1</a>');}

function render(m){
  const d=document.createElement('div');
  d.className='msg '+m.role;
  if(m.role==='assistant'){d.innerHTML=md(m.content);}
  else if(m.role==='tool_activity'){
    d.innerHTML=esc(m.content)+' ('+m.tool_duration_ms+' ms)<pre>'+esc(JSON.stringify({args:m.tool_args,result:m.tool_result},null,2))+'</pre>';
    d.onclick=()=>d.classList.toggle('open');
  }
  else if(m.role==='file'){
    d.innerHTML=esc(m.content)+' - <a href="/api/files/download?path='+encodeURIComponent(m.filename)+'">'+esc(m.filename)+'</a> ('+m.file_size+' bytes)';
  }
  else{d.textContent=m.content;}
  msgs.appendChild(d);
  msgs.scrollTop=msgs.scrollHeight;
}

async function poll(){
  try{
    const r=await fetch('/api/chat/'+chatId+'?since='+since);
    const j=await r.json();
    j.messages.forEach(render);
    since+=j.messages.length;
    if(j.is_processing){timer=setTimeout(poll,1000);}
    else{status.className='';sendBtn.disabled=false;}
  }catch(e){status.className='err';sendBtn.disabled=false;}
}

async function send(text){
  text=(text||input.value).trim();
  if(!text||sendBtn.disabled)return;
  input.value='';
  sendBtn.disabled=true;status.className='wait';
  const body={message:text};
  if(chatId)body.chat_id=chatId;
  const r=await fetch('/api/chat',{method:'POST',headers:{'Content-Type':'application/json'},body:JSON.stringify(body)});
  const j=await r.json();
  if(!r.ok){render({role:'system',content:j.error||('HTTP '+r.status)});sendBtn.disabled=false;status.className='err';return;}
  if(chatId!==j.chat_id){chatId=j.chat_id;since=0;msgs.innerHTML='';}
  poll();
}

sendBtn.addEventListener('click',()=>send());
input.addEventListener('keydown',e=>{if(e.key==='Enter'&&!e.shiftKey){e.preventDefault();send();}});
fetch('/api/config/prompts').then(r=>r.json()).then(list=>{
  const box=document.getElementById('prompts');
  list.forEach(p=>{const b=document.createElement('button');b.textContent=p.label;
    b.onclick=()=>{if(p.prefill){input.value=p.message;input.focus();}else{send(p.message);}};box.appendChild(b);});
}).catch(()=>{});
</script>
</body>
</html>)HTML";

// ── ChatApi ──────────────────────────────────────────────────────────

static ApiResponse api_error(int status, const std::string& msg) {
    return ApiResponse{status, {{"error", msg}}};
}

ChatApi::ChatApi(const Config& cfg, const ToolRegistry& tools, ChatService& service)
    : cfg_(cfg), tools_(tools), service_(service) {}

ApiResponse ChatApi::post_chat(const std::string& request_body) {
    auto j = nlohmann::json::parse(request_body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return api_error(400, "invalid JSON in request body");
    }

    std::string message;
    if (j.contains("message") && j["message"].is_string()) {
        message = j["message"].get<std::string>();
    }
    size_t b = message.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return api_error(400, "Message is required");
    message = message.substr(b, message.find_last_not_of(" \t\r\n") - b + 1);

    std::optional<std::string> chat_id;
    if (j.contains("chat_id") && j["chat_id"].is_string() && !j["chat_id"].get<std::string>().empty()) {
        chat_id = j["chat_id"].get<std::string>();
    }

    auto result = service_.submit(chat_id, message);
    switch (result.status) {
        case SubmitStatus::not_found: return api_error(404, "Chat not found");
        case SubmitStatus::busy: return api_error(409, "Chat is still processing");
        case SubmitStatus::accepted: break;
    }
    return ApiResponse{200, {{"chat_id", result.chat_id}}};
}

ApiResponse ChatApi::get_chat(const std::string& chat_id, const std::string& since) const {
    size_t index = 0;
    if (!since.empty()) {
        if (since.find_first_not_of("0123456789") != std::string::npos || since.size() > 9) {
            return api_error(400, "since must be a non-negative integer");
        }
        index = std::stoul(since);
    }
    auto data = service_.store().messages_since(chat_id, index);
    if (!data) return api_error(404, "Chat not found");
    return ApiResponse{200, std::move(*data)};
}

ApiResponse ChatApi::prompts() const {
    nlohmann::json arr = nlohmann::json::array();
    for (auto& p : cfg_.prebuilt_prompts) arr.push_back(p.to_json());
    return ApiResponse{200, arr};
}

ApiResponse ChatApi::system_config() const {
    nlohmann::json j;
    j["system_prompt"] = build_system_prompt();
    j["tools"] = tools_.tools_spec();
    j["tool_schema_version"] = TOOL_SCHEMA_VERSION;
    j["agent"] = {
        {"model", cfg_.model},
        {"max_tool_calls", cfg_.max_tool_calls},
        {"temperature", cfg_.temperature}
    };
    j["prebuilt_prompts"] = prompts().body;
    return ApiResponse{200, j};
}

FileLookup ChatApi::resolve_download(const std::string& path) const {
    if (path.empty()) return FileLookup{400, "", "path is required"};

    std::error_code ec;
    fs::path base = fs::weakly_canonical(fs::absolute(cfg_.download_dir(), ec), ec);
    if (ec) return FileLookup{404, "", "File not found"};
    fs::path target = fs::weakly_canonical(base / fs::path(path), ec);
    if (ec) return FileLookup{404, "", "File not found"};

    fs::path rel = target.lexically_relative(base);
    if (rel.empty() || rel == "." || *rel.begin() == "..") {
        return FileLookup{403, "", "Access denied"};
    }
    if (!fs::is_regular_file(target, ec)) {
        return FileLookup{404, "", "File not found"};
    }
    return FileLookup{200, target.string(), ""};
}

std::string mime_type_for(const std::string& filename) {
    std::string f = to_lower(filename);
    if (ends_with(f, ".pdf")) return "application/pdf";
    if (ends_with(f, ".xlsx")) return "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet";
    if (ends_with(f, ".xls")) return "application/vnd.ms-excel";
    if (ends_with(f, ".csv")) return "text/csv";
    if (ends_with(f, ".json")) return "application/json";
    if (ends_with(f, ".txt")) return "text/plain";
    if (ends_with(f, ".html") || ends_with(f, ".htm")) return "text/html";
    return "application/octet-stream";
}

// ── HTTPChannel ──────────────────────────────────────────────────────

HTTPChannel::HTTPChannel(const HTTPChannelConfig& cfg, ChatApi& api)
    : config_(cfg), api_(api), rate_limiter_(cfg.rate_limit_rpm) {
    register_routes();
}

static void send_json(httplib::Response& res, const ApiResponse& r) {
    res.status = r.status;
    res.set_content(dump_json(r.body), "application/json");
}

void HTTPChannel::register_routes() {
    server_.Get("/", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(WEB_CHAT_HTML, "text/html");
    });

    server_.Get("/health", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(R"({"status":"ok"})", "application/json");
    });

    server_.set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
        std::string msg = "unknown error";
        try { if (ep) std::rethrow_exception(ep); }
        catch (const std::exception& e) { msg = e.what(); }
        catch (...) { msg = "non-std exception"; }
        std::cerr << "[http] Unhandled exception on " << req.path << ": " << msg << "\n";
        res.status = 500;
        res.set_content(dump_json({{"error", msg}}), "application/json");
    });

    server_.Post("/api/chat", [this](const httplib::Request& req, httplib::Response& res) {
        if (!check_auth(req, res) || !check_rate_limit(req, res)) return;
        send_json(res, api_.post_chat(req.body));
    });

    server_.Get(R"(/api/chat/([A-Za-z0-9_-]+))", [this](const httplib::Request& req, httplib::Response& res) {
        if (!check_auth(req, res) || !check_rate_limit(req, res)) return;
        send_json(res, api_.get_chat(req.matches[1], req.get_param_value("since")));
    });

    server_.Get("/api/config/prompts", [this](const httplib::Request& req, httplib::Response& res) {
        if (!check_auth(req, res) || !check_rate_limit(req, res)) return;
        send_json(res, api_.prompts());
    });

    server_.Get("/api/config/system", [this](const httplib::Request& req, httplib::Response& res) {
        if (!check_auth(req, res) || !check_rate_limit(req, res)) return;
        send_json(res, api_.system_config());
    });

    server_.Get("/api/files/download", [this](const httplib::Request& req, httplib::Response& res) {
        if (!check_auth(req, res) || !check_rate_limit(req, res)) return;
        auto found = api_.resolve_download(req.get_param_value("path"));
        if (found.status != 200) {
            send_json(res, ApiResponse{found.status, {{"error", found.error}}});
            return;
        }
        std::string name = fs::path(found.path).filename().string();
        res.set_header("Content-Disposition", "attachment; filename=\"" + name + "\"");
        res.set_content(read_file(found.path), mime_type_for(name));
    });
}

bool HTTPChannel::listen(const std::string& host, int port) {
    std::cerr << "[http] Listening on " << host << ":" << port << "\n";
    bool ok = server_.listen(host, port);
    if (!ok) std::cerr << "[http] Cannot listen on " << host << ":" << port << "\n";
    return ok;
}

bool HTTPChannel::check_auth(const httplib::Request& req, httplib::Response& res) {
    if (config_.api_key.empty()) return true;

    auto auth = req.get_header_value("Authorization");
    if (auth != "Bearer " + config_.api_key) {
        res.status = 401;
        res.set_content(R"({"error":"unauthorized"})", "application/json");
        return false;
    }
    return true;
}

bool HTTPChannel::check_rate_limit(const httplib::Request& req, httplib::Response& res) {
    if (!rate_limiter_.allow(req.remote_addr)) {
        res.status = 429;
        res.set_content(R"({"error":"rate limit exceeded"})", "application/json");
        return false;
    }
    return true;
}

} // namespace webscout
