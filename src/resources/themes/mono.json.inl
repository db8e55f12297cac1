R"!!({
  "ui.background"  : { "bg": "black" },
  "ui.text"        : "white",
  "ui.header"      : { "fg": "white", "modifiers": ["bold"] },
  "ui.lines"       : "white",
  "ui.selection"   : { "modifiers": ["reversed"] },
  "ui.group"       : { "fg": "white", "modifiers": ["bold", "underline"] },
  "ui.statusline"  : { "fg": "black", "bg": "white" },
  "ui.prompt"      : { "fg": "white", "modifiers": ["bold"] },
  "ui.cursor"      : { "fg": "black", "bg": "white" },
  "ui.info"        : "white",
  "warning"        : { "fg": "white", "modifiers": ["bold"] },
  "error"          : { "fg": "white", "modifiers": ["bold", "underline"] },

  "task.todo"      : "white",
  "task.doing"     : { "fg": "white", "modifiers": ["italic"] },
  "task.done"      : "white",
  "task.important" : { "fg": "white", "modifiers": ["bold"] },

  "palette" : {
    "black" : "#000000",
    "white" : "#e5e5e5"
  }
})!!"
