R"!!({
  "ui.background"  : { "bg": "bg" },
  "ui.text"        : "fg",
  "ui.header"      : { "fg": "blue", "modifiers": ["bold"] },
  "ui.lines"       : "gray",
  "ui.selection"   : { "bg": "selection" },
  "ui.group"       : { "fg": "purple", "modifiers": ["bold"] },
  "ui.statusline"  : { "fg": "fg", "bg": "bg_bar" },
  "ui.prompt"      : { "fg": "blue", "modifiers": ["bold"] },
  "ui.cursor"      : { "fg": "bg", "bg": "fg" },
  "ui.info"        : "gray",
  "warning"        : "yellow",
  "error"          : "red",

  "task.todo"      : "fg",
  "task.doing"     : "yellow",
  "task.done"      : "green",
  "task.important" : { "fg": "red", "modifiers": ["bold"] },

  "palette" : {
    "bg"        : "#1e1e1e",
    "bg_bar"    : "#2d2d30",
    "selection" : "#264f78",
    "fg"        : "#d4d4d4",
    "gray"      : "#808080",
    "blue"      : "#569cd6",
    "purple"    : "#c586c0",
    "yellow"    : "#dcdcaa",
    "green"     : "#6a9955",
    "red"       : "#f44747"
  }
})!!"
