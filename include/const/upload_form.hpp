#pragma once

#include <string>

namespace formdrop {

// Served on GET /. {{FIELD}} is replaced with the configured field name.
inline std::string upload_form_html(const std::string& field_name) {
    std::string page = R"HTML(<!DOCTYPE html>
<html lang="en">
<head>
    <meta charset="UTF-8">
    <meta name="viewport" content="width=device-width, initial-scale=1.0">
    <title>File Upload</title>
    <style>
        body { font-family: sans-serif; display: flex; justify-content: center; align-items: center; min-height: 100vh; background-color: #f0f2f5; margin: 0; }
        .container { background-color: #ffffff; padding: 40px; border-radius: 12px; box-shadow: 0 4px 20px rgba(0, 0, 0, 0.1); text-align: center; max-width: 500px; width: 90%; }
        form { display: flex; flex-direction: column; gap: 20px; }
        input[type="file"], input[type="submit"] { padding: 12px 20px; border: 1px solid #ddd; border-radius: 8px; font-size: 16px; width: 100%; box-sizing: border-box; }
        input[type="submit"] { background-color: #4CAF50; color: white; border: none; cursor: pointer; }
        .message { margin-top: 20px; padding: 15px; border-radius: 8px; }
        .success { background-color: #d4edda; color: #155724; }
        .error { background-color: #f8d7da; color: #721c24; }
    </style>
</head>
<body>
    <div class="container">
        <h1>Upload Your File</h1>
        <form action="/upload" method="post" enctype="multipart/form-data" id="uploadForm">
            <input type="file" name="{{FIELD}}" id="{{FIELD}}" required>
            <input type="submit" value="Upload File">
        </form>
        <div id="message" class="message" style="display: none;"></div>
        <script>
            document.getElementById('uploadForm').addEventListener('submit', async function(event) {
                event.preventDefault();
                const form = event.target;
                const messageDiv = document.getElementById('message');
                try {
                    const response = await fetch(form.action, { method: form.method, body: new FormData(form) });
                    const result = await response.text();
                    messageDiv.style.display = 'block';
                    messageDiv.className = response.ok ? 'message success' : 'message error';
                    messageDiv.textContent = result || 'An unknown error occurred.';
                    if (response.ok) form.reset();
                } catch (error) {
                    messageDiv.style.display = 'block';
                    messageDiv.className = 'message error';
                    messageDiv.textContent = 'Error uploading file: ' + error.message;
                }
            });
        </script>
    </div>
</body>
</html>
)HTML";

    const std::string placeholder = "{{FIELD}}";
    size_t pos = 0;
    while ((pos = page.find(placeholder, pos)) != std::string::npos) {
        page.replace(pos, placeholder.size(), field_name);
        pos += field_name.size();
    }
    return page;
}

} // namespace formdrop
