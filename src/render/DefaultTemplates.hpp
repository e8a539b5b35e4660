/**
 * Noos - Default Templates
 * 
 * Built-in templates used when the user provides none.
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

namespace noos {

constexpr const char* DEFAULT_ITEM_TEMPLATE = R"HTML(<article class="item">
  <header>
    <h2><a href="${link}" target="_blank" rel="noopener">${title}</a></h2>
    <p class="meta"><a href="${channel_link}">${source}</a> &middot; <time datetime="${date}T${time}Z">${date} ${time}</time></p>
  </header>
  <div class="description">${description}</div>
</article>
)HTML";

constexpr const char* DEFAULT_PAGE_TEMPLATE = R"HTML(<!doctype html>
<html lang="en">
<head>
  <meta charset="utf-8">
  <meta name="viewport" content="width=device-width,initial-scale=1">
  <title>noos</title>
  <style>
    body{max-width:820px;margin:2rem auto;padding:0 1rem;font:16px/1.5 system-ui,sans-serif}
    .item{border-bottom:1px solid #ddd;padding:1rem 0}
    .item h2{font-size:1.2rem;margin:0}
    .meta{color:#666;font-size:.9rem;margin:.25rem 0}
    footer{color:#666;font-size:.8rem;margin:2rem 0}
  </style>
</head>
<body>
  <main>
${items}
  </main>
  <footer>${item_count} articles from ${channel_count} channels, generated ${date} ${time} UTC</footer>
</body>
</html>
)HTML";

} // namespace noos
